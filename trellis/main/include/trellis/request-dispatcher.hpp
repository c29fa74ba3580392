#pragma once

#include <exception>

#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"

namespace trellis {

// Seam between the non-generic server loops and the application, which is generic over its context type.
class RequestDispatcher {
 public:
  RequestDispatcher() noexcept = default;

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher(RequestDispatcher&&) noexcept = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(RequestDispatcher&&) noexcept = delete;

  virtual ~RequestDispatcher() = default;

  // Runs pre-route handlers then the handler chain of the matched route.
  // Returns false when nothing handled the request and no route matched.
  // Handler failures propagate as exceptions.
  virtual bool dispatch(HttpRequest& req, HttpResponse& resp) = 0;

  // Invokes the application error handler. Returns false if none is registered.
  // May throw if the error handler itself fails.
  virtual bool handleError(const std::exception& error, HttpRequest& req, HttpResponse& resp) = 0;
};

// Runs one request through the dispatcher. This is the single error boundary of both server modes:
//  - route miss: 404 "Not Found"
//  - handler exception: error handler if registered, else 500 "Internal Server Error"
//  - error handler exception: 500 "Internal Server Error"
// It never throws.
void ProcessExchange(RequestDispatcher& dispatcher, HttpRequest& req, HttpResponse& resp) noexcept;

}  // namespace trellis
