#include <trellis/trellis.hpp>

#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace trellis;

namespace {

struct Stats {
  std::atomic<uint64_t> requests{0};
};

struct StatsView {
  uint64_t requests;
};

}  // namespace

template <>
struct glz::meta<StatsView> {
  using T = StatsView;
  static constexpr auto value = glz::object("requests", &T::requests);
};

namespace {

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 3000;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  Stats stats;
  App<Stats> app(stats);

  try {
    app.use(AccessLog<Stats>());
    app.use(Cors<Stats>());
    app.use([](Stats &ctx, HttpRequest &req, HttpResponse &resp, Next<Stats> &next) {
      ++ctx.requests;
      next(ctx, req, resp);
    });

    app.get("/", [](Stats &, HttpRequest &, HttpResponse &resp) { resp.send("Hello from trellis!"); });

    app.get("/users/:id", [](Stats &, HttpRequest &req, HttpResponse &resp) {
      resp.sendJson(std::map<std::string_view, std::string_view>{{"id", *req.pathParam("id")}});
    });

    app.get("/search", [](Stats &, HttpRequest &req, HttpResponse &resp) {
      std::string out("You searched for: ");
      out.append(req.queryParam("q").value_or("nothing"));
      resp.send(out);
    });

    app.post("/echo", [](Stats &, HttpRequest &req, HttpResponse &resp) {
      resp.status(http::StatusCodeCreated).send(req.body().readAll());
    });

    app.get("/stats", [](Stats &ctx, HttpRequest &, HttpResponse &resp) {
      resp.sendJson(StatsView{ctx.requests.load()});
    });

    auto admin = app.group("/admin");
    admin.use([](Stats &ctx, HttpRequest &req, HttpResponse &resp, Next<Stats> &next) {
      if (req.headerValue("Authorization") != std::optional<std::string_view>("Bearer secret")) {
        resp.status(http::StatusCodeUnauthorized).send("Unauthorized");
        return;
      }
      next(ctx, req, resp);
    });
    admin.get("/dashboard", [](Stats &, HttpRequest &, HttpResponse &resp) { resp.send("Admin dashboard"); });

    app.get("/fail", [](Stats &, HttpRequest &, HttpResponse &) -> void { throw std::runtime_error("intentional"); });
    app.setErrorHandler([](const std::exception &ex, HttpRequest &, HttpResponse &resp, Stats &) {
      resp.status(http::StatusCodeInternalServerError)
          .sendJson(std::map<std::string_view, std::string_view>{{"error", ex.what()}});
    });

    app.listen(ServerConfig{}.withPort(port));  // blocking run, until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
