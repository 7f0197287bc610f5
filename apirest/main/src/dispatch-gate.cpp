#include "apirest/dispatch-gate.hpp"

#include <openssl/crypto.h>

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "apirest/api-rest-config.hpp"
#include "apirest/base64.hpp"
#include "apirest/http-constants.hpp"
#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/log.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/route-table.hpp"
#include "apirest/string-equal-ignore-case.hpp"
#include "apirest/string-trim.hpp"

namespace apirest {

namespace {

constexpr std::string_view kAllowHeaders = "Accept, Content-Type, Content-Length, Accept-Encoding, Authorization";
constexpr std::string_view kAllowMethods = "POST, GET, OPTIONS, PUT, DELETE";
constexpr std::string_view kBasicRealm = "Basic realm=\"auth\"";

bool ConstantTimeEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return lhs.empty() || ::CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace

bool ParseBasicAuthorization(std::string_view headerValue, std::string& user, std::string& password) {
  static constexpr std::string_view kBasicScheme = "Basic ";
  headerValue = TrimOws(headerValue);
  if (!StartsWithCaseInsensitive(headerValue, kBasicScheme)) {
    return false;
  }
  std::string decoded;
  try {
    decoded = B64Decode(TrimOws(headerValue.substr(kBasicScheme.size())));
  } catch (const std::invalid_argument&) {
    return false;
  }
  const auto colonPos = decoded.find(':');
  if (colonPos == std::string::npos) {
    return false;
  }
  user = decoded.substr(0, colonPos);
  password = decoded.substr(colonPos + 1);
  return true;
}

DispatchGate::DispatchGate(std::shared_ptr<const ApiRestConfig> config, std::shared_ptr<const RouteTable> routes)
    : _config(std::move(config)), _routes(std::move(routes)) {
  if (!_config || !_routes) {
    throw std::invalid_argument("DispatchGate requires a configuration and a route table");
  }
}

DispatchGate::Admission DispatchGate::admit(const HttpRequest& request) const {
  if (request.method() == http::Method::OPTIONS) {
    return {Decision::Preflight, std::nullopt};
  }
  auto match = _routes->match(request.path());
  if (!match) {
    return {Decision::NotFound, std::nullopt};
  }
  if (_config->authEnabled() && !checkCredentials(request)) {
    return {Decision::Unauthorized, std::nullopt};
  }
  return {Decision::Proceed, std::move(match)};
}

bool DispatchGate::checkCredentials(const HttpRequest& request) const {
  const auto authorization = request.headerValue(http::Authorization);
  if (!authorization) {
    return false;
  }
  std::string user;
  std::string password;
  if (!ParseBasicAuthorization(*authorization, user, password)) {
    return false;
  }
  // evaluate both to not leak which one differs
  const bool userOk = ConstantTimeEqual(user, _config->username);
  const bool passwordOk = ConstantTimeEqual(password, _config->password);
  return userOk && passwordOk;
}

void DispatchGate::decorate(HttpResponse& response) const {
  response.header(http::XFrameOptions, "DENY")
      .header(http::XContentTypeOptions, "nosniff")
      .header(http::XXSSProtection, "1; mode=block")
      .header(http::ReferrerPolicy, "same-origin")
      .header(http::AccessControlAllowOrigin, _config->allowOrigin)
      .header(http::AccessControlAllowHeaders, kAllowHeaders)
      .header(http::AccessControlAllowMethods, kAllowMethods);
}

HttpResponse DispatchGate::rejection(Decision decision) const {
  HttpResponse response;
  switch (decision) {
    case Decision::Preflight:
      response.status(http::StatusCodeNoContent);
      break;
    case Decision::NotFound:
      response.status(http::StatusCodeNotFound).body("404 page not found\n");
      break;
    case Decision::Unauthorized:
      response.status(http::StatusCodeUnauthorized).body("Unauthorized\n").header(http::WWWAuthenticate, kBasicRealm);
      break;
    default:
      throw std::invalid_argument("no rejection response for an admitted request");
  }
  decorate(response);
  return response;
}

HttpResponse DispatchGate::dispatch(const HttpRequest& request, ResourceHandlers& handlers) const {
  const auto admission = admit(request);
  if (admission.decision != Decision::Proceed) {
    if (admission.decision == Decision::Unauthorized) {
      log::debug("rejected unauthenticated {} {}", http::MethodToStr(request.method()), request.path());
    }
    return rejection(admission.decision);
  }

  HttpResponse response;
  try {
    switch (admission.match->resource) {
      case Resource::Events:
        response = handlers.events(request);
        break;
      case Resource::Session:
        response = handlers.session(request, *admission.match);
        break;
      case Resource::File:
        response = handlers.file(request);
        break;
      default:
        response = HttpResponse(http::StatusCodeNotFound, "404 page not found\n");
        break;
    }
  } catch (const std::exception& ex) {
    log::error("{} handler failed for {} {}: {}", ResourceName(admission.match->resource),
               http::MethodToStr(request.method()), request.path(), ex.what());
    response = HttpResponse(http::StatusCodeInternalServerError, "Internal Server Error\n");
  }
  decorate(response);
  return response;
}

}  // namespace apirest
