#pragma once

#include <string>
#include <string_view>

#include "apirest/tls-raii.hpp"

namespace apirest {

// RAII wrapper around a server SSL_CTX loaded from a PEM certificate file and a PEM private key file.
class TlsContext {
 public:
  // Throws std::runtime_error if the material cannot be loaded or if the key does not match the certificate.
  TlsContext(const std::string& certFile, const std::string& keyFile);

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;
  TlsContext(TlsContext&&) noexcept = default;
  TlsContext& operator=(TlsContext&&) noexcept = default;

  ~TlsContext() = default;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

  // Create a new server-side SSL object bound to given fd, in accept state.
  // Throws std::runtime_error on failure.
  [[nodiscard]] SslPtr newServerSsl(int fd) const;

 private:
  SslCtxPtr _ctx;
};

// Pop and concatenate all pending OpenSSL errors of the current thread.
[[nodiscard]] std::string OpenSslErrors();

}  // namespace apirest
