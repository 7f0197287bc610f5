#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "apirest/http-request.hpp"
#include "apirest/http-status-code.hpp"

namespace apirest {

struct HttpParserLimits {
  std::size_t maxHeaderBytes{8UL * 1024UL};
  std::size_t maxBodyBytes{1UL << 20};
};

struct HttpParseResult {
  enum class Status : uint8_t {
    Complete,    // A full request (head + body) is available, bytesConsumed tells its size
    Incomplete,  // Need more data
    Error        // Malformed or unacceptable request, errorStatus tells which status to answer before closing
  };

  Status status{Status::Incomplete};
  HttpRequest request;
  std::size_t bytesConsumed{0};
  http::StatusCode errorStatus{http::StatusCodeBadRequest};
  std::string_view errorReason;
};

// Parse one HTTP/1.0 or HTTP/1.1 request from the beginning of data.
// Bodies are delimited by Content-Length only: chunked transfer encoding is answered with 501.
[[nodiscard]] HttpParseResult ParseHttpRequest(std::string_view data, const HttpParserLimits& limits);

}  // namespace apirest
