#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/http-constants.hpp"
#include "apirest/http-status-code.hpp"

namespace apirest {

// HTTP/1.1 response built by handlers and the dispatch gate, serialized by the listener.
class HttpResponse {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) noexcept : _statusCode(code) {}

  HttpResponse(http::StatusCode code, std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode code) noexcept {
    _statusCode = code;
    return *this;
  }

  // Set a header, replacing any existing header with the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value);

  // Append a header, keeping existing ones with the same name.
  HttpResponse& addHeader(std::string_view name, std::string_view value);

  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Serialize into HTTP/1.1 wire format.
  // Content-Length is always emitted (except for 1xx and 204), 'Connection: close' when closeConnection is set.
  // The body is omitted for HEAD requests.
  [[nodiscard]] std::string serialize(bool closeConnection, bool headRequest = false) const;

 private:
  http::StatusCode _statusCode;
  std::vector<HeaderField> _headers;
  std::string _body;
};

}  // namespace apirest
