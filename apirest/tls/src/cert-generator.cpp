#include "apirest/cert-generator.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <sys/stat.h>

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "apirest/cert-profile.hpp"
#include "apirest/errno-throw.hpp"
#include "apirest/log.hpp"
#include "apirest/tls-context.hpp"
#include "apirest/tls-raii.hpp"

namespace apirest {

namespace {

constexpr uint32_t kMinRsaBits = 1024;
constexpr int kSerialBits = 128;

[[noreturn]] void ThrowOpenSsl(std::string_view what) {
  throw std::runtime_error(std::format("{}: {}", what, OpenSslErrors()));
}

PKeyPtr GenerateRsaKey(uint32_t bits) {
  if (bits < kMinRsaBits) {
    throw std::invalid_argument(std::format("RSA key size {} is too small (minimum {})", bits, kMinRsaBits));
  }
  PKeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), ::EVP_PKEY_CTX_free);
  if (!kctx) {
    ThrowOpenSsl("EVP_PKEY_CTX_new_from_name failed");
  }
  EVP_PKEY* pkey = nullptr;
  if (::EVP_PKEY_keygen_init(kctx.get()) != 1 ||
      ::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), static_cast<int>(bits)) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    ThrowOpenSsl("RSA key generation failed");
  }
  return {pkey, ::EVP_PKEY_free};
}

void AddNameEntry(X509_NAME* name, const char* field, const std::string& value) {
  if (value.empty()) {
    return;
  }
  if (::X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8, reinterpret_cast<const unsigned char*>(value.c_str()),
                                   -1, -1, 0) != 1) {
    ThrowOpenSsl(std::format("Invalid certificate subject field {}='{}'", field, value));
  }
}

void AddExtension(X509* x509, int nid, const char* value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, x509, x509, nullptr, nullptr, 0);
  X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
  if (ext == nullptr) {
    ThrowOpenSsl("X509V3_EXT_conf_nid failed");
  }
  const int ret = ::X509_add_ext(x509, ext, -1);
  ::X509_EXTENSION_free(ext);
  if (ret != 1) {
    ThrowOpenSsl("X509_add_ext failed");
  }
}

BioPtr OpenFileBio(const std::string& path) {
  BIO* bio = ::BIO_new_file(path.c_str(), "w");
  if (bio == nullptr) {
    ThrowOpenSsl(std::format("Unable to open {} for writing", path));
  }
  return {bio, ::BIO_free};
}

void SetRandomSerial(X509* x509) {
  BigNumPtr serial(::BN_new(), ::BN_free);
  if (!serial || ::BN_rand(serial.get(), kSerialBits, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
      ::BN_to_ASN1_INTEGER(serial.get(), ::X509_get_serialNumber(x509)) == nullptr) {
    ThrowOpenSsl("Unable to generate certificate serial number");
  }
}

}  // namespace

void SelfSignedCertGenerator::generate(const CertProfile& profile, const std::string& certOutPath,
                                       const std::string& keyOutPath) {
  log::debug("generating {} bits RSA key for CN={}", profile.bits, profile.commonName);
  auto pkey = GenerateRsaKey(profile.bits);

  auto x509Ptr = MakeX509(::X509_new());
  X509* x509 = x509Ptr.get();
  if (::X509_set_version(x509, X509_VERSION_3) != 1) {
    ThrowOpenSsl("X509_set_version failed");
  }
  SetRandomSerial(x509);
  ::X509_gmtime_adj(::X509_getm_notBefore(x509), 0);
  ::X509_gmtime_adj(::X509_getm_notAfter(x509), static_cast<long>(_validity.count()));
  if (::X509_set_pubkey(x509, pkey.get()) != 1) {
    ThrowOpenSsl("X509_set_pubkey failed");
  }

  X509_NAME* name = ::X509_get_subject_name(x509);
  AddNameEntry(name, "C", profile.country);
  AddNameEntry(name, "L", profile.locality);
  AddNameEntry(name, "O", profile.organization);
  AddNameEntry(name, "OU", profile.organizationalUnit);
  AddNameEntry(name, "CN", profile.commonName);
  if (::X509_set_issuer_name(x509, name) != 1) {
    ThrowOpenSsl("X509_set_issuer_name failed");
  }

  AddExtension(x509, NID_basic_constraints, "critical,CA:FALSE");
  AddExtension(x509, NID_key_usage, "critical,digitalSignature,keyEncipherment");
  AddExtension(x509, NID_ext_key_usage, "serverAuth");
  AddExtension(x509, NID_subject_key_identifier, "hash");

  if (::X509_sign(x509, pkey.get(), ::EVP_sha256()) <= 0) {
    ThrowOpenSsl("X509_sign failed");
  }

  {
    auto keyBio = OpenFileBio(keyOutPath);
    if (::chmod(keyOutPath.c_str(), S_IRUSR | S_IWUSR) != 0) {
      throw_errno("chmod failed for {}", keyOutPath);
    }
    if (::PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1 ||
        BIO_flush(keyBio.get()) != 1) {
      ThrowOpenSsl(std::format("Unable to write private key to {}", keyOutPath));
    }
  }
  {
    auto certBio = OpenFileBio(certOutPath);
    if (::PEM_write_bio_X509(certBio.get(), x509) != 1 || BIO_flush(certBio.get()) != 1) {
      ThrowOpenSsl(std::format("Unable to write certificate to {}", certOutPath));
    }
  }
}

}  // namespace apirest
