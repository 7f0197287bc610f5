#pragma once

#include <string>
#include <string_view>

#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"

namespace apirest::websocket {

/// A valid key is exactly 24 base64 characters (representing 16 random bytes).
[[nodiscard]] bool IsValidWebSocketKey(std::string_view key);

/// Compute the Sec-WebSocket-Accept value from a client's Sec-WebSocket-Key (RFC 6455 section 1.3):
/// base64(SHA-1(key + GUID)).
[[nodiscard]] std::string ComputeWebSocketAccept(std::string_view key);

struct UpgradeValidation {
  bool valid{false};
  std::string_view errorReason;
  std::string acceptKey;
};

/// Check that given request is a well-formed WebSocket opening handshake (GET, 'Upgrade: websocket',
/// 'Connection: upgrade', 'Sec-WebSocket-Version: 13' and a valid key).
[[nodiscard]] UpgradeValidation ValidateUpgradeRequest(const HttpRequest& request);

/// 101 Switching Protocols response completing the handshake.
[[nodiscard]] HttpResponse BuildUpgradeResponse(std::string_view acceptKey);

}  // namespace apirest::websocket
