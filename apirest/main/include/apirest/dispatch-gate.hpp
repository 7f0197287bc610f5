#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "apirest/api-rest-config.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/route-table.hpp"

namespace apirest {

// Per-request logic applied before any resource handler:
//  1. OPTIONS requests (CORS preflight), on any path, are answered 204 without reaching route logic.
//  2. Unknown paths are answered 404, whatever the credentials.
//  3. When authentication is enabled, requests without valid Basic credentials are answered 401.
// Every response leaving the gate, including the short-circuit ones, carries the CORS and security headers.
class DispatchGate {
 public:
  enum class Decision : uint8_t { Preflight, NotFound, Unauthorized, Proceed };

  struct Admission {
    Decision decision;
    // Set only when decision is Proceed.
    std::optional<RouteMatch> match;
  };

  DispatchGate(std::shared_ptr<const ApiRestConfig> config, std::shared_ptr<const RouteTable> routes);

  [[nodiscard]] Admission admit(const HttpRequest& request) const;

  // Decorated response for a short-circuit decision (all decisions except Proceed).
  [[nodiscard]] HttpResponse rejection(Decision decision) const;

  // Add the CORS and security headers to given response.
  void decorate(HttpResponse& response) const;

  // Full plain HTTP dispatch: admission, then handler invocation. Handler exceptions become 500 responses.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest& request, ResourceHandlers& handlers) const;

  [[nodiscard]] const ApiRestConfig& config() const noexcept { return *_config; }

 private:
  [[nodiscard]] bool checkCredentials(const HttpRequest& request) const;

  std::shared_ptr<const ApiRestConfig> _config;
  std::shared_ptr<const RouteTable> _routes;
};

// Decodes an 'Authorization: Basic ...' header value into its user and password parts.
// Returns false if the value is not a well formed Basic credential.
[[nodiscard]] bool ParseBasicAuthorization(std::string_view headerValue, std::string& user, std::string& password);

}  // namespace apirest
