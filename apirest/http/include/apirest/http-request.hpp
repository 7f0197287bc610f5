#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/http-method.hpp"

namespace apirest {

// Owning HTTP/1.x request. Owning (rather than viewing the connection buffer) so that it can be handed over to a
// handler running outside of the event loop.
class HttpRequest {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  HttpRequest() noexcept = default;

  // target is the raw request-target ('/api/session?x=1').
  HttpRequest(http::Method method, std::string_view target, std::string_view version = "HTTP/1.1");

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Path part of the target, without the query.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query part of the target (after '?'), empty if none.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  // Value of the first header matching given name (case-insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Whether the connection should stay open after this request (HTTP/1.1 default unless 'Connection: close',
  // HTTP/1.0 only with 'Connection: keep-alive').
  [[nodiscard]] bool keepAlive() const noexcept;

  HttpRequest& addHeader(std::string_view name, std::string_view value);

  HttpRequest& body(std::string body) {
    _body = std::move(body);
    return *this;
  }

 private:
  http::Method _method{http::Method::GET};
  std::string _path;
  std::string _query;
  std::string _version;
  std::vector<HeaderField> _headers;
  std::string _body;
};

}  // namespace apirest
