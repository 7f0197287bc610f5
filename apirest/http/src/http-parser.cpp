#include "apirest/http-parser.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include "apirest/http-constants.hpp"
#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/string-equal-ignore-case.hpp"
#include "apirest/string-trim.hpp"

namespace apirest {

namespace {

HttpParseResult ParseError(http::StatusCode status, std::string_view reason) {
  HttpParseResult result;
  result.status = HttpParseResult::Status::Error;
  result.errorStatus = status;
  result.errorReason = reason;
  return result;
}

constexpr bool IsTokenChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

}  // namespace

HttpParseResult ParseHttpRequest(std::string_view data, const HttpParserLimits& limits) {
  const auto headEnd = data.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (data.size() > limits.maxHeaderBytes) {
      return ParseError(http::StatusCodeRequestHeaderFieldsTooLarge, "request head too large");
    }
    return {};
  }
  if (headEnd + http::DoubleCRLF.size() > limits.maxHeaderBytes) {
    return ParseError(http::StatusCodeRequestHeaderFieldsTooLarge, "request head too large");
  }

  std::string_view head = data.substr(0, headEnd);
  const auto requestLineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, requestLineEnd);
  head = requestLineEnd == std::string_view::npos ? std::string_view{} : head.substr(requestLineEnd + 2);

  // METHOD SP request-target SP HTTP-version
  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp) {
    return ParseError(http::StatusCodeBadRequest, "malformed request line");
  }
  const auto methodStr = requestLine.substr(0, firstSp);
  const auto target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  const auto version = requestLine.substr(lastSp + 1);
  if (target.empty() || target.front() != '/' || target.find(' ') != std::string_view::npos) {
    return ParseError(http::StatusCodeBadRequest, "invalid request target");
  }
  if (version != http::HTTP11Sv && version != http::HTTP10Sv) {
    if (version.starts_with("HTTP/")) {
      return ParseError(http::StatusCodeHTTPVersionNotSupported, "unsupported HTTP version");
    }
    return ParseError(http::StatusCodeBadRequest, "malformed HTTP version");
  }
  const auto method = http::MethodFromStr(methodStr);
  if (!method) {
    return ParseError(http::StatusCodeNotImplemented, "unknown method");
  }

  HttpParseResult result;
  result.request = HttpRequest(*method, target, version);

  while (!head.empty()) {
    const auto lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + 2);

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return ParseError(http::StatusCodeBadRequest, "malformed header line");
    }
    const auto name = line.substr(0, colonPos);
    for (char ch : name) {
      if (!IsTokenChar(ch)) {
        return ParseError(http::StatusCodeBadRequest, "invalid header name");
      }
    }
    result.request.addHeader(name, TrimOws(line.substr(colonPos + 1)));
  }

  if (auto transferEncoding = result.request.headerValue(http::TransferEncoding)) {
    if (!CaseInsensitiveEqual(TrimOws(*transferEncoding), "identity")) {
      return ParseError(http::StatusCodeNotImplemented, "unsupported transfer encoding");
    }
  }

  std::size_t contentLength = 0;
  if (auto contentLengthStr = result.request.headerValue(http::ContentLength)) {
    const auto* first = contentLengthStr->data();
    const auto* last = first + contentLengthStr->size();
    const auto [ptr, ec] = std::from_chars(first, last, contentLength);
    if (ec != std::errc{} || ptr != last || contentLengthStr->empty()) {
      return ParseError(http::StatusCodeBadRequest, "invalid Content-Length");
    }
    if (contentLength > limits.maxBodyBytes) {
      return ParseError(http::StatusCodePayloadTooLarge, "body too large");
    }
  }

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  if (data.size() - bodyStart < contentLength) {
    return {};
  }
  result.request.body(std::string(data.substr(bodyStart, contentLength)));
  result.bytesConsumed = bodyStart + contentLength;
  result.status = HttpParseResult::Status::Complete;
  return result;
}

}  // namespace apirest
