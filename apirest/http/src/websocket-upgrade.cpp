#include "apirest/websocket-upgrade.hpp"

#include <openssl/sha.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "apirest/base64.hpp"
#include "apirest/http-constants.hpp"
#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/string-equal-ignore-case.hpp"
#include "apirest/websocket-constants.hpp"

namespace apirest::websocket {

bool IsValidWebSocketKey(std::string_view key) {
  static constexpr std::size_t kEncodedKeySize = 24;
  if (key.size() != kEncodedKeySize || !key.ends_with("==")) {
    return false;
  }
  try {
    return B64Decode(key).size() == 16;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

std::string ComputeWebSocketAccept(std::string_view key) {
  std::string concat(key);
  concat.append(kGUID);

  unsigned char hash[SHA_DIGEST_LENGTH];
  ::SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);

  return B64Encode(std::string_view(reinterpret_cast<const char*>(hash), sizeof(hash)));
}

UpgradeValidation ValidateUpgradeRequest(const HttpRequest& request) {
  UpgradeValidation ret;
  if (request.method() != http::Method::GET) {
    ret.errorReason = "websocket: the client is not using the websocket protocol: request method is not GET";
    return ret;
  }
  if (!HeaderListContainsToken(request.headerValueOrEmpty(http::Connection), http::upgrade)) {
    ret.errorReason = "websocket: the client is not using the websocket protocol: 'upgrade' token not found in "
                      "'Connection' header";
    return ret;
  }
  if (!HeaderListContainsToken(request.headerValueOrEmpty(http::Upgrade), UpgradeValue)) {
    ret.errorReason = "websocket: the client is not using the websocket protocol: 'websocket' token not found in "
                      "'Upgrade' header";
    return ret;
  }
  if (request.headerValueOrEmpty(SecWebSocketVersion) != kVersion) {
    ret.errorReason = "websocket: unsupported version: 13 not found in 'Sec-Websocket-Version' header";
    return ret;
  }
  const auto key = request.headerValueOrEmpty(SecWebSocketKey);
  if (!IsValidWebSocketKey(key)) {
    ret.errorReason = "websocket: not a websocket handshake: 'Sec-WebSocket-Key' header is missing or invalid";
    return ret;
  }
  ret.valid = true;
  ret.acceptKey = ComputeWebSocketAccept(key);
  return ret;
}

HttpResponse BuildUpgradeResponse(std::string_view acceptKey) {
  HttpResponse response(http::StatusCodeSwitchingProtocols);
  response.header(http::Upgrade, UpgradeValue);
  response.header(http::Connection, "Upgrade");
  response.header(SecWebSocketAccept, acceptKey);
  return response;
}

}  // namespace apirest::websocket
