#pragma once

#include <chrono>
#include <string>

#include "apirest/cert-profile.hpp"

namespace apirest {

// Capability generating a fresh certificate and private key, written as PEM to the two given paths.
// Implementations throw on failure and may be slow (key generation).
class CertGenerator {
 public:
  virtual ~CertGenerator() = default;

  virtual void generate(const CertProfile& profile, const std::string& certOutPath, const std::string& keyOutPath) = 0;
};

// OpenSSL based generator of a RSA key and a self-signed X.509 v3 server certificate.
class SelfSignedCertGenerator : public CertGenerator {
 public:
  static constexpr std::chrono::seconds kDefaultValidity{std::chrono::hours{24 * 365}};

  explicit SelfSignedCertGenerator(std::chrono::seconds validity = kDefaultValidity) noexcept
      : _validity(validity) {}

  void generate(const CertProfile& profile, const std::string& certOutPath, const std::string& keyOutPath) override;

 private:
  std::chrono::seconds _validity;
};

}  // namespace apirest
