#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "trellis/handler-chain.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/static-file-handler.hpp"

namespace trellis {

struct CorsOptions {
  std::string allowOrigin{"*"};
  std::string allowMethods{"GET, POST, PUT, DELETE, OPTIONS"};
  std::string allowHeaders{"Content-Type, Authorization"};
};

// Adds the CORS headers to every response. Preflight (OPTIONS) requests are answered with 204 and the
// rest of the chain is skipped.
template <class Context>
HandlerUnit<Context> Cors(CorsOptions options = {}) {
  return [options = std::move(options)](Context& ctx, HttpRequest& req, HttpResponse& resp, Next<Context>& next) {
    resp.header("Access-Control-Allow-Origin", options.allowOrigin);
    resp.header("Access-Control-Allow-Methods", options.allowMethods);
    resp.header("Access-Control-Allow-Headers", options.allowHeaders);
    if (req.method() == http::Method::OPTIONS) {
      resp.status(http::StatusCodeNoContent);
      return;
    }
    next(ctx, req, resp);
  };
}

// Logs one access line per request once the remainder of the chain has run:
//   127.0.0.1:51234 "GET /users/42 HTTP/1.1" 200 3ms
template <class Context>
HandlerUnit<Context> AccessLog() {
  return [](Context& ctx, HttpRequest& req, HttpResponse& resp, Next<Context>& next) {
    const auto start = std::chrono::steady_clock::now();
    next(ctx, req, resp);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log::info("{} \"{} {} {}\" {} {}ms", req.peerAddress(), http::MethodToStr(req.method()), req.target(),
              req.version(), resp.status(), elapsed.count());
  };
}

// Middleware flavor of StaticFileHandler for route-scoped use: answers from 'root' when it can,
// otherwise continues the chain.
template <class Context>
HandlerUnit<Context> StaticFiles(const std::filesystem::path& root) {
  auto handler = std::make_shared<const StaticFileHandler>(root);
  return [handler = std::move(handler)](Context& ctx, HttpRequest& req, HttpResponse& resp, Next<Context>& next) {
    if (!handler->handle(req, resp)) {
      next(ctx, req, resp);
    }
  };
}

}  // namespace trellis
