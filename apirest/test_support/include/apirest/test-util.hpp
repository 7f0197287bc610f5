#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/http-status-code.hpp"
#include "apirest/socket.hpp"

namespace apirest::test {
using namespace std::chrono_literals;

// Blocking TCP connection to the loopback interface.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Retries connecting until timeout, then throws std::runtime_error.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  [[nodiscard]] std::string_view header(std::string_view name) const;

  http::StatusCode statusCode{0};
  std::string reason;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
  std::chrono::milliseconds timeout{5000ms};
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until a complete HTTP response (headers and Content-Length body) was received, the peer closed, or timeout.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until the peer closes the connection or timeout.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 5000ms);

// Very small HTTP/1.1 response parser (not resilient to all malformed cases, just for test consumption).
std::optional<ParsedResponse> parseResponse(std::string_view raw);

ParsedResponse parseResponseOrThrow(std::string_view raw);

std::string buildRequest(const RequestOptions& opt);

std::optional<std::string> request(uint16_t port, const RequestOptions& opt = {});

// Convenience wrapper that throws std::runtime_error on failure instead of returning std::nullopt.
std::string requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// GET given path (Connection: close) and parse the response. Throws std::runtime_error on failure.
ParsedResponse simpleGet(uint16_t port, std::string_view path,
                         std::vector<std::pair<std::string, std::string>> extraHeaders = {});

// 'Basic <base64(user:password)>'
std::string BasicAuthorization(std::string_view user, std::string_view password);

// Returns true if a TCP connection to the loopback port can be established.
bool AttemptConnect(uint16_t port);

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

bool WaitForListenerClosed(uint16_t port, std::chrono::milliseconds timeout);

}  // namespace apirest::test
