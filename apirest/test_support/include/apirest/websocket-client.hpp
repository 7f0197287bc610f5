#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/test-util.hpp"
#include "apirest/websocket-constants.hpp"
#include "apirest/websocket-frame.hpp"

namespace apirest::test {

// Blocking plain-text websocket client for tests. Frames sent are masked as required for clients.
class WebSocketClient {
 public:
  struct Frame {
    websocket::Opcode opcode;
    std::string payload;
  };

  explicit WebSocketClient(uint16_t port);

  // Send the upgrade request for given path and read the server answer.
  // Returns the parsed handshake response (101 on success). Throws std::runtime_error on I/O failure.
  ParsedResponse connect(std::string_view path,
                         const std::vector<std::pair<std::string, std::string>>& extraHeaders = {});

  bool sendText(std::string_view payload);

  bool sendPing(std::string_view payload);

  bool sendClose(websocket::CloseCode code, std::string_view reason = {});

  // Send already encoded bytes (for protocol error tests).
  bool sendRaw(std::string_view data);

  // Wait for the next complete frame, std::nullopt on timeout or connection close.
  std::optional<Frame> receiveFrame(std::chrono::milliseconds timeout = std::chrono::seconds{2});

  [[nodiscard]] int fd() const noexcept { return _cnx.fd(); }

  [[nodiscard]] std::string_view secWebSocketKey() const noexcept { return _key; }

 private:
  bool sendFrame(websocket::Opcode opcode, std::string_view payload);

  ClientConnection _cnx;
  std::string _key{"dGhlIHNhbXBsZSBub25jZQ=="};
  std::string _buffer;
  uint8_t _maskSeed{0x37};
};

}  // namespace apirest::test
