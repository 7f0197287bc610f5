#pragma once

#include <string_view>

#include "apirest/api-rest-config.hpp"
#include "apirest/cert-profile.hpp"
#include "apirest/parameter-store.hpp"

namespace apirest {

namespace param {

inline constexpr std::string_view kAddress = "api.rest.address";
inline constexpr std::string_view kPort = "api.rest.port";
inline constexpr std::string_view kAllowOrigin = "api.rest.alloworigin";
inline constexpr std::string_view kCertificate = "api.rest.certificate";
inline constexpr std::string_view kKey = "api.rest.key";
inline constexpr std::string_view kUsername = "api.rest.username";
inline constexpr std::string_view kPassword = "api.rest.password";
inline constexpr std::string_view kWebsocket = "api.rest.websocket";

inline constexpr std::string_view kCertBits = "api.rest.certificate.bits";
inline constexpr std::string_view kCertCommonName = "api.rest.certificate.commonname";
inline constexpr std::string_view kCertCountry = "api.rest.certificate.country";
inline constexpr std::string_view kCertLocality = "api.rest.certificate.locality";
inline constexpr std::string_view kCertOrganization = "api.rest.certificate.organization";
inline constexpr std::string_view kCertOrganizationalUnit = "api.rest.certificate.organizationalunit";

}  // namespace param

// Register all api.rest parameters (with their defaults and validators) into given store.
void RegisterApiRestParameters(ParameterStore& store);

// Reads the api.rest parameters from the store, in a fixed order, failing on the first invalid one.
class ConfigResolver {
 public:
  explicit ConfigResolver(const ParameterStore& store) noexcept : _store(store) {}

  // Throws ApiRestError(InvalidConfiguration) carrying the store error message unchanged.
  [[nodiscard]] ApiRestConfig resolve() const;

  // Certificate profile, only needed when a new TLS identity has to be generated.
  // Throws ApiRestError(InvalidConfiguration).
  [[nodiscard]] CertProfile resolveCertProfile() const;

 private:
  const ParameterStore& _store;
};

}  // namespace apirest
