// trellis umbrella header
//
// Pulls in the public API needed by typical applications:
//   - App, its route groups and the server configuration
//   - Request / Response primitives, methods and status codes
//   - Bundled middleware (CORS, access log, static files) and multipart upload helpers
//
// Lower level pieces (connection state, event loop, framing) are internal to the server loops and are not
// re-exported. Include specific headers instead of this one to reduce compile times.

#pragma once

// Application & configuration
#include "trellis/app.hpp"             // IWYU pragma: export
#include "trellis/server-config.hpp"   // IWYU pragma: export
#include "trellis/json-serializer.hpp"  // IWYU pragma: export
#include "trellis/signal-handler.hpp"  // IWYU pragma: export

// HTTP primitives
#include "trellis/http-constants.hpp"    // IWYU pragma: export
#include "trellis/http-method.hpp"       // IWYU pragma: export
#include "trellis/http-request.hpp"      // IWYU pragma: export
#include "trellis/http-response.hpp"     // IWYU pragma: export
#include "trellis/http-status-code.hpp"  // IWYU pragma: export

// Collaborators
#include "trellis/file-upload-handler.hpp"  // IWYU pragma: export
#include "trellis/middleware.hpp"           // IWYU pragma: export
#include "trellis/multipart-form-data.hpp"  // IWYU pragma: export
#include "trellis/static-file-handler.hpp"  // IWYU pragma: export
