#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/event-server.hpp"
#include "trellis/handler-chain.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/request-dispatcher.hpp"
#include "trellis/router.hpp"
#include "trellis/server-config.hpp"
#include "trellis/static-file-handler.hpp"
#include "trellis/thread-pool-server.hpp"

namespace trellis {

// Application object: routes, middleware, error handler and the server loop serving them.
//
// All registrations (routes, middleware, static roots, error handler) must be done before listen(). While serving,
// the routing structures are only read, concurrently, by the server threads.
// The context is shared by all requests of all threads: its thread safety is the application's concern.
//
// Usage example:
//   struct Counter { std::atomic<int> hits; };
//   Counter counter;
//   App<Counter> app(counter);
//   app.use(AccessLog<Counter>());
//   app.get("/users/:id", [](Counter& ctx, HttpRequest& req, HttpResponse& resp) {
//     ++ctx.hits;
//     resp.send(*req.pathParam("id"));
//   });
//   app.listen(ServerConfig{}.withPort(8080));
template <class Context>
class App final : public RequestDispatcher {
 public:
  using Unit = HandlerUnit<Context>;
  using Units = typename Router<Context>::Units;
  using ErrorHandler = std::function<void(const std::exception&, HttpRequest&, HttpResponse&, Context&)>;

  // Routes registered under a common path prefix, preceded by the group's own middleware.
  // Group middleware must be added before the routes it should apply to.
  class RouteGroup {
   public:
    RouteGroup& use(Unit middleware) {
      _middleware.push_back(std::move(middleware));
      return *this;
    }

    RouteGroup& add(http::Method method, std::string_view path, Units handlers) {
      Units units = _middleware;
      units.insert(units.end(), std::make_move_iterator(handlers.begin()), std::make_move_iterator(handlers.end()));
      _app->add(method, JoinPath(_prefix, path), std::move(units));
      return *this;
    }

    template <class... Fns>
    RouteGroup& get(std::string_view path, Fns&&... fns) {
      return add(http::Method::GET, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& post(std::string_view path, Fns&&... fns) {
      return add(http::Method::POST, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& put(std::string_view path, Fns&&... fns) {
      return add(http::Method::PUT, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& patch(std::string_view path, Fns&&... fns) {
      return add(http::Method::PATCH, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& del(std::string_view path, Fns&&... fns) {
      return add(http::Method::DELETE, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& options(std::string_view path, Fns&&... fns) {
      return add(http::Method::OPTIONS, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    template <class... Fns>
    RouteGroup& head(std::string_view path, Fns&&... fns) {
      return add(http::Method::HEAD, path, MakeUnits(std::forward<Fns>(fns)...));
    }

    [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

   private:
    friend class App;

    RouteGroup(App& app, std::string prefix) : _app(&app), _prefix(std::move(prefix)) {}

    App* _app;
    std::string _prefix;
    Units _middleware;
  };

  explicit App(Context& ctx) noexcept : _ctx(&ctx) {}

  // Appends a global middleware, run before the handlers of every matched route in registration order.
  App& use(Unit middleware) {
    _router.use(std::move(middleware));
    return *this;
  }

  // Registers the handler chain for method and path, replacing any previous one.
  // Throws std::invalid_argument for malformed paths.
  App& add(http::Method method, std::string_view path, Units handlers) {
    _router.add(method, path, std::move(handlers));
    return *this;
  }

  template <class... Fns>
  App& get(std::string_view path, Fns&&... fns) {
    return add(http::Method::GET, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& post(std::string_view path, Fns&&... fns) {
    return add(http::Method::POST, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& put(std::string_view path, Fns&&... fns) {
    return add(http::Method::PUT, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& patch(std::string_view path, Fns&&... fns) {
    return add(http::Method::PATCH, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& del(std::string_view path, Fns&&... fns) {
    return add(http::Method::DELETE, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& options(std::string_view path, Fns&&... fns) {
    return add(http::Method::OPTIONS, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  template <class... Fns>
  App& head(std::string_view path, Fns&&... fns) {
    return add(http::Method::HEAD, path, MakeUnits(std::forward<Fns>(fns)...));
  }

  [[nodiscard]] RouteGroup group(std::string prefix) { return RouteGroup(*this, std::move(prefix)); }

  // Serves files below root before routing. Files found there shadow routes with the same path.
  // Throws std::filesystem::filesystem_error if root does not exist.
  App& serveStatic(const std::filesystem::path& root) {
    _staticHandlers.emplace_back(root);
    return *this;
  }

  // Called with the exception thrown by a handler. The response is given as the handler left it.
  App& setErrorHandler(ErrorHandler errorHandler) {
    _errorHandler = std::move(errorHandler);
    return *this;
  }

  // Binds, listens and serves until stop() is called. Blocking.
  // Throws std::invalid_argument for an invalid config, std::system_error if the server cannot be set up.
  void listen(const ServerConfig& config) {
    config.validate();
    if (config.mode == ServerMode::ThreadPool) {
      serve<ThreadPoolServer>(config);
    } else {
      serve<EventServer>(config);
    }
  }

  // Makes listen() return. Called before listen(), the next listen() returns right away.
  // Thread-safe.
  void stop() noexcept {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    _stopRequested = true;
    if (_stopServer) {
      _stopServer();
    }
  }

  // Bound port while listening, 0 otherwise.
  [[nodiscard]] uint16_t port() const {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    return _port;
  }

  // Waits until the server is bound. Returns the bound port, or 0 on timeout.
  uint16_t waitListening(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(_lifecycleMutex);
    _listeningCv.wait_for(lock, timeout, [this] { return _port != 0; });
    return _port;
  }

  [[nodiscard]] const Router<Context>& router() const noexcept { return _router; }

  [[nodiscard]] Context& context() noexcept { return *_ctx; }

  bool dispatch(HttpRequest& req, HttpResponse& resp) override {
    for (const StaticFileHandler& staticHandler : _staticHandlers) {
      if (staticHandler.handle(req, resp)) {
        return true;
      }
    }
    auto match = _router.findRoute(req.method(), req.path(), req.resource());
    if (!match) {
      return false;
    }
    req.setPathParams(std::move(match->params));
    Next<Context> next(match->handlers);
    next(*_ctx, req, resp);
    return true;
  }

  bool handleError(const std::exception& error, HttpRequest& req, HttpResponse& resp) override {
    if (!_errorHandler) {
      return false;
    }
    _errorHandler(error, req, resp, *_ctx);
    return true;
  }

 private:
  template <class... Fns>
  static Units MakeUnits(Fns&&... fns) {
    Units units;
    units.reserve(sizeof...(Fns));
    (units.emplace_back(std::forward<Fns>(fns)), ...);
    return units;
  }

  static std::string JoinPath(std::string_view prefix, std::string_view path) {
    while (!prefix.empty() && prefix.back() == '/') {
      prefix.remove_suffix(1);
    }
    std::string joined(prefix);
    if (!path.starts_with('/')) {
      joined.push_back('/');
    }
    joined.append(path);
    return joined;
  }

  template <class Server>
  void serve(const ServerConfig& config) {
    Server server(config, *this);
    {
      std::lock_guard<std::mutex> lock(_lifecycleMutex);
      _stopServer = [&server]() noexcept { server.stop(); };
      _port = server.port();
      if (_stopRequested) {
        server.stop();
      }
    }
    _listeningCv.notify_all();

    struct ExitGuard {
      ~ExitGuard() { app->onServerExit(); }

      App* app;
    } exitGuard{this};

    server.run();
  }

  void onServerExit() noexcept {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    _stopServer = nullptr;
    _stopRequested = false;
    _port = 0;
  }

  Context* _ctx;
  Router<Context> _router;
  std::vector<StaticFileHandler> _staticHandlers;
  ErrorHandler _errorHandler;

  mutable std::mutex _lifecycleMutex;
  mutable std::condition_variable _listeningCv;
  std::function<void()> _stopServer;
  bool _stopRequested{false};
  uint16_t _port{0};
};

}  // namespace trellis
