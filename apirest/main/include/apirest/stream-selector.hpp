#pragma once

#include <cstdint>

#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/route-table.hpp"

namespace apirest {

// Chooses the wire behavior of the events resource: a websocket push channel or a plain request/response resource.
// The choice is made when the request is dispatched and holds for the rest of the connection lifetime.
class StreamSelector {
 public:
  enum class Channel : uint8_t { Plain, WebSocket };

  struct Negotiation {
    bool accepted{false};
    // 101 Switching Protocols if accepted, otherwise the handshake error response.
    HttpResponse response;
  };

  explicit StreamSelector(bool useWebsocket) noexcept : _useWebsocket(useWebsocket) {}

  [[nodiscard]] Channel select(const RouteMatch& match) const noexcept {
    return _useWebsocket && match.resource == Resource::Events ? Channel::WebSocket : Channel::Plain;
  }

  // Validates the websocket opening handshake of a request routed to the websocket channel.
  [[nodiscard]] static Negotiation negotiate(const HttpRequest& request);

 private:
  bool _useWebsocket;
};

}  // namespace apirest
