#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"

namespace trellis {

template <class Context>
class Next;

// Terminal unit of a chain.
template <class Context>
using Endpoint = std::function<void(Context&, HttpRequest&, HttpResponse&)>;

// Intermediate unit of a chain: decides whether and when the remainder of the chain runs by invoking 'next'.
template <class Context>
using Middleware = std::function<void(Context&, HttpRequest&, HttpResponse&, Next<Context>&)>;

// A handler chain unit, either an endpoint or a middleware.
// Failures are reported by throwing, they propagate through the chain untouched.
template <class Context>
class HandlerUnit {
 public:
  enum class Kind : uint8_t { Endpoint, Middleware };

  // Accepts any callable: those invocable with a Next continuation become middleware, the others endpoints.
  template <class Fn>
    requires(!std::is_same_v<std::remove_cvref_t<Fn>, HandlerUnit>)
  HandlerUnit(Fn&& fn)  // NOLINT(google-explicit-constructor)
      : _fn(MakeVariant(std::forward<Fn>(fn))) {}

  [[nodiscard]] Kind kind() const noexcept {
    return std::holds_alternative<Endpoint<Context>>(_fn) ? Kind::Endpoint : Kind::Middleware;
  }

  // Runs the unit. An endpoint ignores 'next'.
  void invoke(Context& ctx, HttpRequest& req, HttpResponse& resp, Next<Context>& next) const {
    if (const auto* endpoint = std::get_if<Endpoint<Context>>(&_fn)) {
      (*endpoint)(ctx, req, resp);
    } else {
      std::get<Middleware<Context>>(_fn)(ctx, req, resp, next);
    }
  }

 private:
  using Variant = std::variant<Endpoint<Context>, Middleware<Context>>;

  template <class Fn>
  static Variant MakeVariant(Fn&& fn) {
    if constexpr (std::is_invocable_v<Fn&, Context&, HttpRequest&, HttpResponse&, Next<Context>&>) {
      return Variant(std::in_place_type<Middleware<Context>>, std::forward<Fn>(fn));
    } else {
      static_assert(std::is_invocable_v<Fn&, Context&, HttpRequest&, HttpResponse&>,
                    "handler must be callable as (Context&, HttpRequest&, HttpResponse&[, Next&])");
      return Variant(std::in_place_type<Endpoint<Context>>, std::forward<Fn>(fn));
    }
  }

  Variant _fn;
};

// Continuation over an immutable sequence of units. Calling it runs the unit at its cursor, handing that unit
// a fresh Next positioned one unit further, so the cursor only ever moves forward and no state is shared
// between nested invocations. Calling it past the end is a no-op.
template <class Context>
class Next {
 public:
  using Unit = HandlerUnit<Context>;
  using Units = std::span<const Unit* const>;

  explicit Next(Units units, std::size_t cursor = 0) noexcept : _units(units), _cursor(cursor) {}

  void operator()(Context& ctx, HttpRequest& req, HttpResponse& resp) const {
    if (_cursor >= _units.size()) {
      return;
    }
    Next next(_units, _cursor + 1);
    _units[_cursor]->invoke(ctx, req, resp, next);
  }

  [[nodiscard]] std::size_t cursor() const noexcept { return _cursor; }

  [[nodiscard]] bool done() const noexcept { return _cursor >= _units.size(); }

 private:
  Units _units;
  std::size_t _cursor;
};

}  // namespace trellis
