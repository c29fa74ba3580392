#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "trellis/handler-chain.hpp"
#include "trellis/http-method.hpp"
#include "trellis/path-segments.hpp"
#include "trellis/string-map.hpp"

namespace trellis {

// Prefix tree router, one tree per HTTP method.
//
// Paths are made of literal segments and ':name' parameter segments capturing exactly one segment.
// At each node an exact literal child is always preferred over the parameter child, and matching never
// backtracks: once the parameter child is taken, no other branch is tried.
//
// Routes and global middleware are registered before serving starts; the router is then read concurrently
// by worker threads without locking. Registering while serving is not supported.
template <class Context>
class Router {
 public:
  using Unit = HandlerUnit<Context>;
  using Units = std::vector<Unit>;

  // Result of a successful lookup. Both members allocate from the memory resource given to findRoute.
  struct RouteMatch {
    // Global middleware followed by the route's own handlers.
    std::pmr::vector<const Unit*> handlers;
    // Parameter name to captured segment.
    StringMap params;
  };

  Router() = default;

  // Attaches 'handlers' to 'path' for 'method', replacing any previous registration of the same path and method.
  // Re-registering a parameter segment at the same position under a different name renames the parameter.
  // Throws std::invalid_argument for an empty parameter name (a lone ':' segment).
  void add(http::Method method, std::string_view path, Units handlers) {
    auto& root = _trees[http::MethodToIdx(method)];
    if (!root) {
      root = std::make_unique<Node>();
    }
    Node* current = root.get();
    PathSegments segments(path);
    for (std::string_view segment; segments.next(segment);) {
      if (segment.front() == kParamSigil) {
        std::string_view paramName = segment.substr(1);
        if (paramName.empty()) {
          throw std::invalid_argument("empty parameter name in route path");
        }
        if (!current->paramChild) {
          current->paramChild = std::make_unique<Node>();
        }
        current->paramName.assign(paramName);
        current = current->paramChild.get();
      } else {
        auto it = current->literalChildren.find(segment);
        if (it == current->literalChildren.end()) {
          it = current->literalChildren.emplace(std::string(segment), std::make_unique<Node>()).first;
        }
        current = it->second.get();
      }
    }
    current->handlers = std::move(handlers);
  }

  // Appends a middleware run before the handlers of every matched route.
  void use(Unit middleware) { _globalMiddleware.push_back(std::move(middleware)); }

  // Resolves 'path' for 'method'. Returns std::nullopt when the method has no routes, when a segment
  // matches neither a literal nor a parameter child, or when the final node carries no handlers.
  [[nodiscard]] std::optional<RouteMatch> findRoute(
      http::Method method, std::string_view path,
      std::pmr::memory_resource* mr = std::pmr::get_default_resource()) const {
    const Node* current = _trees[http::MethodToIdx(method)].get();
    if (current == nullptr) {
      return std::nullopt;
    }
    StringMap params(mr);
    PathSegments segments(path);
    for (std::string_view segment; segments.next(segment);) {
      auto it = current->literalChildren.find(segment);
      if (it != current->literalChildren.end()) {
        current = it->second.get();
      } else if (current->paramChild) {
        params.set(current->paramName, segment);
        current = current->paramChild.get();
      } else {
        return std::nullopt;
      }
    }
    if (!current->handlers) {
      return std::nullopt;
    }

    std::pmr::vector<const Unit*> handlers(mr);
    handlers.reserve(_globalMiddleware.size() + current->handlers->size());
    for (const Unit& unit : _globalMiddleware) {
      handlers.push_back(&unit);
    }
    for (const Unit& unit : *current->handlers) {
      handlers.push_back(&unit);
    }
    return RouteMatch{std::move(handlers), std::move(params)};
  }

  [[nodiscard]] std::span<const Unit> globalMiddleware() const noexcept { return _globalMiddleware; }

 private:
  static constexpr char kParamSigil = ':';

  struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view sv) const noexcept { return std::hash<std::string_view>{}(sv); }
  };

  struct Node {
    std::unordered_map<std::string, std::unique_ptr<Node>, StringHash, std::equal_to<>> literalChildren;
    std::unique_ptr<Node> paramChild;
    std::string paramName;
    std::optional<Units> handlers;
  };

  std::array<std::unique_ptr<Node>, http::kNbMethods> _trees;
  Units _globalMiddleware;
};

}  // namespace trellis
