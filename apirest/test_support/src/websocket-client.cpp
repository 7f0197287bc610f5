#include "apirest/websocket-client.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/test-util.hpp"
#include "apirest/websocket-constants.hpp"
#include "apirest/websocket-frame.hpp"

namespace apirest::test {

WebSocketClient::WebSocketClient(uint16_t port) : _cnx(port) {}

ParsedResponse WebSocketClient::connect(std::string_view path,
                                        const std::vector<std::pair<std::string, std::string>>& extraHeaders) {
  RequestOptions opt;
  opt.target = std::string(path);
  opt.connection = "Upgrade";
  opt.headers = {{"Upgrade", "websocket"}, {"Sec-WebSocket-Version", "13"}, {"Sec-WebSocket-Key", _key}};
  opt.headers.insert(opt.headers.end(), extraHeaders.begin(), extraHeaders.end());
  if (!sendAll(_cnx.fd(), buildRequest(opt))) {
    throw std::runtime_error("unable to send websocket upgrade request");
  }

  // Read the handshake response only, frames may follow it immediately.
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
  char buf[4096];
  std::size_t headerEnd = std::string::npos;
  while ((headerEnd = _buffer.find("\r\n\r\n")) == std::string::npos) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error("timeout waiting for websocket upgrade response");
    }
    pollfd pfd{_cnx.fd(), POLLIN, 0};
    if (::poll(&pfd, 1, 10) <= 0) {
      continue;
    }
    const auto nbRead = ::recv(_cnx.fd(), buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      break;
    }
    _buffer.append(buf, static_cast<std::size_t>(nbRead));
  }
  if (headerEnd == std::string::npos) {
    throw std::runtime_error("connection closed before websocket upgrade response");
  }
  auto response = parseResponseOrThrow(std::string_view(_buffer).substr(0, headerEnd + 4));
  if (response.statusCode == 101) {
    _buffer.erase(0, headerEnd + 4);
  } else {
    // Error answers carry a body: give back everything received.
    response = parseResponseOrThrow(_buffer + recvWithTimeout(_cnx.fd(), std::chrono::milliseconds{200}));
    _buffer.clear();
  }
  return response;
}

bool WebSocketClient::sendFrame(websocket::Opcode opcode, std::string_view payload) {
  websocket::MaskingKey key{_maskSeed, static_cast<uint8_t>(_maskSeed * 3U), static_cast<uint8_t>(_maskSeed + 11U),
                            static_cast<uint8_t>(_maskSeed ^ 0xA5U)};
  _maskSeed = static_cast<uint8_t>(_maskSeed + 7U);
  std::string frame;
  websocket::BuildFrame(frame, opcode, payload, true, key);
  return sendAll(_cnx.fd(), frame);
}

bool WebSocketClient::sendText(std::string_view payload) { return sendFrame(websocket::Opcode::Text, payload); }

bool WebSocketClient::sendPing(std::string_view payload) { return sendFrame(websocket::Opcode::Ping, payload); }

bool WebSocketClient::sendClose(websocket::CloseCode code, std::string_view reason) {
  std::string frame;
  websocket::BuildCloseFrame(frame, code, reason, true, websocket::MaskingKey{1, 2, 3, 4});
  return sendAll(_cnx.fd(), frame);
}

bool WebSocketClient::sendRaw(std::string_view data) { return sendAll(_cnx.fd(), data); }

std::optional<WebSocketClient::Frame> WebSocketClient::receiveFrame(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[4096];
  for (;;) {
    auto parsed = websocket::ParseFrame(_buffer, 0, false);
    if (parsed.status == websocket::FrameParseResult::Status::Complete) {
      _buffer.erase(0, parsed.bytesConsumed);
      return Frame{parsed.header.opcode, std::move(parsed.payload)};
    }
    if (parsed.status != websocket::FrameParseResult::Status::Incomplete) {
      throw std::runtime_error("invalid frame from server: " + std::string(parsed.errorMessage));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    pollfd pfd{_cnx.fd(), POLLIN, 0};
    if (::poll(&pfd, 1, 10) <= 0) {
      continue;
    }
    const auto nbRead = ::recv(_cnx.fd(), buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      return std::nullopt;
    }
    _buffer.append(buf, static_cast<std::size_t>(nbRead));
  }
}

}  // namespace apirest::test
