#include "apirest/config-resolver.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "apirest/api-rest-config.hpp"
#include "apirest/api-rest-error.hpp"
#include "apirest/cert-profile.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/parameter.hpp"
#include "apirest/path-expand.hpp"

namespace apirest {

void RegisterApiRestParameters(ParameterStore& store) {
  const ApiRestConfig defaults;
  const CertProfile profile;

  store.add({std::string(param::kAddress), ParamType::String, defaults.address, IsIPv4Address,
             "Address to bind the API REST server to."});
  store.add({std::string(param::kPort), ParamType::Int, std::to_string(defaults.port), IntRangeValidator(0, 65535),
             "Port to bind the API REST server to (0 for an ephemeral port)."});
  store.add({std::string(param::kAllowOrigin), ParamType::String, defaults.allowOrigin, {},
             "Value of the Access-Control-Allow-Origin header of the API server."});
  store.add({std::string(param::kCertificate), ParamType::String, "", {}, "API TLS certificate."});
  store.add({std::string(param::kKey), ParamType::String, "", {}, "API TLS key."});
  store.add({std::string(param::kUsername), ParamType::String, "", {}, "API authentication username."});
  store.add({std::string(param::kPassword), ParamType::String, "", {}, "API authentication password."});
  store.add({std::string(param::kWebsocket), ParamType::Bool, "false", {},
             "If true the /api/events route will be available as a websocket endpoint instead of HTTPS."});

  store.add({std::string(param::kCertBits), ParamType::Int, std::to_string(profile.bits), IntRangeValidator(1024, 16384),
             "Number of bits of the RSA private key of the generated TLS certificate."});
  store.add({std::string(param::kCertCommonName), ParamType::String, profile.commonName, {},
             "Common Name field of the generated TLS certificate."});
  store.add({std::string(param::kCertCountry), ParamType::String, profile.country, {},
             "Country field of the generated TLS certificate."});
  store.add({std::string(param::kCertLocality), ParamType::String, profile.locality, {},
             "Locality field of the generated TLS certificate."});
  store.add({std::string(param::kCertOrganization), ParamType::String, profile.organization, {},
             "Organization field of the generated TLS certificate."});
  store.add({std::string(param::kCertOrganizationalUnit), ParamType::String, profile.organizationalUnit, {},
             "Organizational Unit field of the generated TLS certificate."});
}

ApiRestConfig ConfigResolver::resolve() const {
  ApiRestConfig config;
  try {
    config.address = _store.getString(param::kAddress);
    config.port = static_cast<uint16_t>(_store.getInt(param::kPort));
    config.allowOrigin = _store.getString(param::kAllowOrigin);
    config.certFile = ExpandPath(_store.getString(param::kCertificate));
    config.keyFile = ExpandPath(_store.getString(param::kKey));
    config.username = _store.getString(param::kUsername);
    config.password = _store.getString(param::kPassword);
    config.useWebsocket = _store.getBool(param::kWebsocket);
  } catch (const std::invalid_argument& ex) {
    // ParameterError and path expansion errors
    throw ApiRestError(ApiRestErrc::InvalidConfiguration, ex.what());
  } catch (const std::filesystem::filesystem_error& ex) {
    throw ApiRestError(ApiRestErrc::InvalidConfiguration, ex.what());
  }
  return config;
}

CertProfile ConfigResolver::resolveCertProfile() const {
  CertProfile profile;
  try {
    profile.bits = static_cast<uint32_t>(_store.getInt(param::kCertBits));
    profile.commonName = _store.getString(param::kCertCommonName);
    profile.country = _store.getString(param::kCertCountry);
    profile.locality = _store.getString(param::kCertLocality);
    profile.organization = _store.getString(param::kCertOrganization);
    profile.organizationalUnit = _store.getString(param::kCertOrganizationalUnit);
  } catch (const ParameterError& ex) {
    throw ApiRestError(ApiRestErrc::InvalidConfiguration, ex.what());
  }
  return profile;
}

}  // namespace apirest
