#include "apirest/tls-context.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "apirest/tls-raii.hpp"

namespace apirest {

std::string OpenSslErrors() {
  std::string ret;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (!ret.empty()) {
      ret.append("; ");
    }
    ret.append(errBuf);
  }
  return ret.empty() ? std::string("unknown OpenSSL error") : ret;
}

TlsContext::TlsContext(const std::string& certFile, const std::string& keyFile)
    : _ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    throw std::runtime_error(std::format("SSL_CTX_new failed: {}", OpenSslErrors()));
  }
  auto* ctx = _ctx.get();
  ::SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
  if (::SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1) {
    throw std::runtime_error("Failed to set minimum TLS version");
  }
  // Partial writes are needed by the non-blocking transport.
  ::SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

  if (::SSL_CTX_use_certificate_chain_file(ctx, certFile.c_str()) != 1) {
    throw std::runtime_error(std::format("Failed to load certificate {}: {}", certFile, OpenSslErrors()));
  }
  if (::SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) != 1) {
    throw std::runtime_error(std::format("Failed to load private key {}: {}", keyFile, OpenSslErrors()));
  }
  if (::SSL_CTX_check_private_key(ctx) != 1) {
    throw std::runtime_error(std::format("Private key {} does not match certificate {}", keyFile, certFile));
  }
}

SslPtr TlsContext::newServerSsl(int fd) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    throw std::runtime_error(std::format("SSL_new failed: {}", OpenSslErrors()));
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    throw std::runtime_error(std::format("SSL_set_fd failed: {}", OpenSslErrors()));
  }
  ::SSL_set_accept_state(ssl.get());
  return ssl;
}

}  // namespace apirest
