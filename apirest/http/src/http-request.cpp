#include "apirest/http-request.hpp"

#include <optional>
#include <string_view>

#include "apirest/http-constants.hpp"
#include "apirest/http-method.hpp"
#include "apirest/string-equal-ignore-case.hpp"

namespace apirest {

HttpRequest::HttpRequest(http::Method method, std::string_view target, std::string_view version)
    : _method(method), _version(version) {
  const auto queryPos = target.find('?');
  _path = target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    _query = target.substr(queryPos + 1);
  }
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return value;
    }
  }
  return std::nullopt;
}

bool HttpRequest::keepAlive() const noexcept {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (_version == http::HTTP10Sv) {
    return HeaderListContainsToken(connection, http::keepalive);
  }
  return !HeaderListContainsToken(connection, http::close);
}

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

}  // namespace apirest
