#pragma once

#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/route-table.hpp"

namespace apirest {

// Handlers producing the content of each logical resource. They are only invoked for requests accepted by the
// dispatch gate (preflight answered, credentials verified, path known), possibly concurrently from several threads.
// Any exception they throw is turned into a 500 response.
class ResourceHandlers {
 public:
  virtual ~ResourceHandlers() = default;

  // '/api/events' when not served as a websocket.
  virtual HttpResponse events(const HttpRequest& request) = 0;

  // '/api/session' and its sub-resources.
  virtual HttpResponse session(const HttpRequest& request, const RouteMatch& match) = 0;

  // '/api/file'.
  virtual HttpResponse file(const HttpRequest& request) = 0;
};

}  // namespace apirest
