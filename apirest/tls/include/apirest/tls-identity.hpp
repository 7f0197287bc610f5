#pragma once

#include <functional>
#include <memory>
#include <string>

#include "apirest/cert-generator.hpp"
#include "apirest/cert-profile.hpp"

namespace apirest {

// Certificate and key paths used to authenticate the service. 'generated' tells whether the material was created by
// the last ensure() call or loaded from existing files.
struct TlsIdentity {
  std::string certFile;
  std::string keyFile;
  bool generated{false};
};

// Load-preferring provider of the TLS identity:
//  - if both files exist they are reused as is (no expiry nor trust check),
//  - otherwise a new pair is generated into temporary files next to the targets, then renamed over them.
// On any failure no partially written pair is left behind.
class TlsIdentityProvider {
 public:
  // Called only when generation is needed, it may throw (e.g. invalid profile parameters).
  using ProfileSupplier = std::function<CertProfile()>;

  explicit TlsIdentityProvider(std::shared_ptr<CertGenerator> generator);

  // Throws ApiRestError(TlsBootstrapFailed) on generation or I/O failure. Exceptions thrown by the profile supplier
  // that are already ApiRestError propagate unchanged.
  [[nodiscard]] TlsIdentity ensure(const std::string& certPath, const std::string& keyPath,
                                   const ProfileSupplier& profileSupplier) const;

 private:
  void generate(const std::string& certPath, const std::string& keyPath, const CertProfile& profile) const;

  std::shared_ptr<CertGenerator> _generator;
};

}  // namespace apirest
