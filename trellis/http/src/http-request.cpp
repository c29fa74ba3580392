#include "trellis/http-request.hpp"

#include <string_view>

#include "trellis/body-reader.hpp"
#include "trellis/query-params.hpp"
#include "trellis/request-arena.hpp"
#include "trellis/request-head.hpp"

namespace trellis {

HttpRequest::HttpRequest(const RequestHead& head, BodyReader body, std::string_view peerAddress,
                         RequestArena& arena)
    : _head(&head),
      _body(body),
      _peerAddress(peerAddress),
      _arena(&arena),
      _queryParams(ParseQueryString(head.query, arena.resource())),
      _pathParams(arena.resource()) {}

}  // namespace trellis
