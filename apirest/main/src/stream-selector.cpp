#include "apirest/stream-selector.hpp"

#include <string>

#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/log.hpp"
#include "apirest/websocket-upgrade.hpp"

namespace apirest {

StreamSelector::Negotiation StreamSelector::negotiate(const HttpRequest& request) {
  Negotiation ret;
  auto validation = websocket::ValidateUpgradeRequest(request);
  if (validation.valid) {
    ret.accepted = true;
    ret.response = websocket::BuildUpgradeResponse(validation.acceptKey);
    return ret;
  }
  log::debug("websocket handshake rejected: {}", validation.errorReason);
  const auto status =
      request.method() == http::Method::GET ? http::StatusCodeBadRequest : http::StatusCodeMethodNotAllowed;
  ret.response = HttpResponse(status, std::string(validation.errorReason) + '\n');
  return ret;
}

}  // namespace apirest
