#pragma once

#include <string_view>

namespace apirest::http {

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Header names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Upgrade = "Upgrade";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Origin = "Origin";
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view WWWAuthenticate = "WWW-Authenticate";
inline constexpr std::string_view AccessControlAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view AccessControlAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view AccessControlAllowHeaders = "Access-Control-Allow-Headers";
inline constexpr std::string_view XFrameOptions = "X-Frame-Options";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";
inline constexpr std::string_view XXSSProtection = "X-XSS-Protection";
inline constexpr std::string_view ReferrerPolicy = "Referrer-Policy";

// Header values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view upgrade = "upgrade";
inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

}  // namespace apirest::http
