#include "apirest/tls-client.hpp"

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/log.hpp"
#include "apirest/test-util.hpp"
#include "apirest/tls-context.hpp"
#include "apirest/tls-raii.hpp"

namespace apirest::test {

TlsClient::TlsClient(uint16_t port) : _cnx(port), _ctx(::SSL_CTX_new(::TLS_client_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    log::error("TlsClient: SSL_CTX_new failed: {}", OpenSslErrors());
    return;
  }
  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_NONE, nullptr);
  _ssl.reset(::SSL_new(_ctx.get()));
  if (!_ssl) {
    log::error("TlsClient: SSL_new failed: {}", OpenSslErrors());
    return;
  }
  ::SSL_set_fd(_ssl.get(), _cnx.fd());
  if (::SSL_connect(_ssl.get()) != 1) {
    log::error("TlsClient: handshake with port {} failed: {}", port, OpenSslErrors());
    return;
  }
  _handshakeOk = true;
}

TlsClient::~TlsClient() {
  if (_handshakeOk && _ssl) {
    ::SSL_shutdown(_ssl.get());
  }
}

bool TlsClient::writeAll(std::string_view data) {
  if (!_handshakeOk) {
    return false;
  }
  while (!data.empty()) {
    const int written = ::SSL_write(_ssl.get(), data.data(), static_cast<int>(data.size()));
    if (written <= 0) {
      const int err = ::SSL_get_error(_ssl.get(), written);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
  return true;
}

std::string TlsClient::readAll() {
  std::string out;
  if (!_handshakeOk) {
    return out;
  }
  char buf[4096];
  for (;;) {
    const int bytesRead = ::SSL_read(_ssl.get(), buf, sizeof(buf));
    if (bytesRead > 0) {
      out.append(buf, static_cast<std::size_t>(bytesRead));
      continue;
    }
    const int err = ::SSL_get_error(_ssl.get(), bytesRead);
    if (bytesRead < 0 && (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)) {
      continue;
    }
    break;
  }
  return out;
}

std::string TlsClient::get(std::string_view target,
                           const std::vector<std::pair<std::string, std::string>>& extraHeaders) {
  RequestOptions opt;
  opt.target = std::string(target);
  opt.headers = extraHeaders;
  if (!writeAll(buildRequest(opt))) {
    return {};
  }
  return readAll();
}

std::string TlsClient::peerCommonName() const {
  if (!_handshakeOk) {
    return {};
  }
  X509Ptr cert(::SSL_get1_peer_certificate(_ssl.get()), ::X509_free);
  if (!cert) {
    return {};
  }
  char buf[256];
  const int len = ::X509_NAME_get_text_by_NID(::X509_get_subject_name(cert.get()), NID_commonName, buf, sizeof(buf));
  if (len < 0) {
    return {};
  }
  return {buf, static_cast<std::size_t>(len)};
}

}  // namespace apirest::test
