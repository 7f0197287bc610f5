#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/test-util.hpp"
#include "apirest/tls-raii.hpp"

namespace apirest::test {

// Minimal blocking TLS client for tests. Peer verification is disabled, the service certificates are self-signed.
class TlsClient {
 public:
  explicit TlsClient(uint16_t port);

  TlsClient(const TlsClient&) = delete;
  TlsClient(TlsClient&&) noexcept = delete;
  TlsClient& operator=(const TlsClient&) = delete;
  TlsClient& operator=(TlsClient&&) noexcept = delete;

  ~TlsClient();

  [[nodiscard]] bool handshakeOk() const noexcept { return _handshakeOk; }

  bool writeAll(std::string_view data);

  // Read until close (or error). Returns accumulated data.
  std::string readAll();

  // Perform a GET request with 'Connection: close' and read the entire response.
  std::string get(std::string_view target, const std::vector<std::pair<std::string, std::string>>& extraHeaders = {});

  // Subject common name of the certificate presented by the server, empty if unavailable.
  [[nodiscard]] std::string peerCommonName() const;

 private:
  ClientConnection _cnx;
  SslCtxPtr _ctx{nullptr, ::SSL_CTX_free};
  SslPtr _ssl{nullptr, ::SSL_free};
  bool _handshakeOk{false};
};

}  // namespace apirest::test
