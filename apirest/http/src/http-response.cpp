#include "apirest/http-response.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/http-constants.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/string-equal-ignore-case.hpp"

namespace apirest {

HttpResponse::HttpResponse(http::StatusCode code, std::string body, std::string_view contentType)
    : _statusCode(code) {
  this->body(std::move(body), contentType);
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  std::erase_if(_headers, [name](const HeaderField& field) { return CaseInsensitiveEqual(field.first, name); });
  _headers.emplace_back(name, value);
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (!_body.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return value;
    }
  }
  return std::nullopt;
}

std::string HttpResponse::serialize(bool closeConnection, bool headRequest) const {
  std::string out;
  out.reserve(128 + _body.size());
  out.append(http::HTTP11Sv);
  out.append(std::format(" {} {}", _statusCode, http::ReasonPhrase(_statusCode)));
  out.append(http::CRLF);

  const bool noBodyStatus = _statusCode < 200 || _statusCode == http::StatusCodeNoContent;
  for (const auto& [name, value] : _headers) {
    if (CaseInsensitiveEqual(name, http::ContentLength) ||
        (closeConnection && CaseInsensitiveEqual(name, http::Connection))) {
      continue;
    }
    out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (closeConnection) {
    out.append(http::Connection).append(http::HeaderSep).append(http::close).append(http::CRLF);
  }
  if (!noBodyStatus) {
    out.append(std::format("{}: {}", http::ContentLength, _body.size())).append(http::CRLF);
  }
  out.append(http::CRLF);
  if (!headRequest && !noBodyStatus) {
    out.append(_body);
  }
  return out;
}

}  // namespace apirest
