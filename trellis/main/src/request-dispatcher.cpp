#include "trellis/request-dispatcher.hpp"

#include <exception>

#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"

namespace trellis {

namespace {

void SetInternalError(HttpResponse& resp) noexcept {
  resp.reset();
  try {
    resp.status(http::StatusCodeInternalServerError).send("Internal Server Error");
  } catch (const std::exception& ex) {
    // Only reachable on allocation failure, the status alone is still meaningful.
    log::critical("Unable to build 500 response body: {}", ex.what());
  }
}

}  // namespace

void ProcessExchange(RequestDispatcher& dispatcher, HttpRequest& req, HttpResponse& resp) noexcept {
  try {
    if (!dispatcher.dispatch(req, resp)) {
      resp.status(http::StatusCodeNotFound).send("Not Found");
    }
    return;
  } catch (const std::exception& ex) {
    log::error("Handler error on {} {}: {}", http::MethodToStr(req.method()), req.path(), ex.what());
    try {
      if (dispatcher.handleError(ex, req, resp)) {
        return;
      }
    } catch (const std::exception& handlerEx) {
      log::error("Error handler failed on {} {}: {}", http::MethodToStr(req.method()), req.path(), handlerEx.what());
    } catch (...) {
      log::error("Error handler failed on {} {} with a non-standard exception", http::MethodToStr(req.method()),
                 req.path());
    }
  } catch (...) {
    // Not a std::exception, so the error handler cannot receive it.
    log::error("Handler on {} {} threw a non-standard exception", http::MethodToStr(req.method()), req.path());
  }
  SetInternalError(resp);
}

}  // namespace trellis
