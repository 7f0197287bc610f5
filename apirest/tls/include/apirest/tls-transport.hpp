#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "apirest/tls-raii.hpp"
#include "apirest/transport.hpp"

namespace apirest {

// Non-blocking TLS transport (OpenSSL). The handshake is driven lazily by the first read or write.
class TlsTransport : public ITransport {
 public:
  explicit TlsTransport(SslPtr sslPtr) noexcept : _ssl(std::move(sslPtr)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Best-effort TLS shutdown (non-blocking). Safe to call multiple times.
  void shutdown() noexcept;

 private:
  TransportHint handshake(TransportHint want);

  // Maps a failed SSL_* call return code to what the caller should wait for.
  // SSL_ERROR_ZERO_RETURN maps to None, any other unrecoverable error logs and drains the OpenSSL error queue.
  TransportHint classifyFailure(int sslRet, TransportHint onWouldBlock) const noexcept;

  void drainErrors() const noexcept;

  SslPtr _ssl;
  bool _handshakeDone{false};
};

}  // namespace apirest
