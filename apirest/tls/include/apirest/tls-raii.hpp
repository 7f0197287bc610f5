#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>

namespace apirest {

// Generic RAII aliases (function pointer deleters keep type size = one pointer)
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using BigNumPtr = std::unique_ptr<BIGNUM, decltype(&::BN_free)>;

inline BioPtr MakeBio(BIO* bio) {
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

inline X509Ptr MakeX509(X509* x509) {
  if (x509 == nullptr) {
    throw std::bad_alloc();
  }
  return {x509, ::X509_free};
}

}  // namespace apirest
