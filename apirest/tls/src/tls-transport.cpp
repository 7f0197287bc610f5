#include "apirest/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "apirest/log.hpp"
#include "apirest/transport.hpp"

namespace apirest {

TransportHint TlsTransport::classifyFailure(int sslRet, TransportHint onWouldBlock) const noexcept {
  switch (::SSL_get_error(_ssl.get(), sslRet)) {
    case SSL_ERROR_ZERO_RETURN:
      // close_notify received
      return TransportHint::None;
    case SSL_ERROR_WANT_READ:
      return TransportHint::ReadReady;
    case SSL_ERROR_WANT_WRITE:
      return TransportHint::WriteReady;
    case SSL_ERROR_SYSCALL:
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return onWouldBlock;
      }
      [[fallthrough]];
    default:
      drainErrors();
      return TransportHint::Error;
  }
}

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake(TransportHint::ReadReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }
  const int rc = ::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed);
  if (rc != 1) {
    ret.bytesProcessed = 0;
    ret.want = classifyFailure(rc, TransportHint::ReadReady);
  }
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake(TransportHint::WriteReady)};
  while (ret.want == TransportHint::None && ret.bytesProcessed < data.size()) {
    std::size_t written = 0;
    const int rc =
        ::SSL_write_ex(_ssl.get(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, &written);
    if (rc == 1) {
      ret.bytesProcessed += written;
    } else {
      ret.want = classifyFailure(rc, TransportHint::WriteReady);
      if (ret.want == TransportHint::None) {
        // peer closed the TLS session while we were still writing
        ret.want = TransportHint::Error;
      }
    }
  }
  return ret;
}

void TlsTransport::shutdown() noexcept {
  if (_ssl && _handshakeDone) {
    // close_notify only, the peer's answer is not awaited as the socket is closed right after.
    ::SSL_shutdown(_ssl.get());
  }
}

void TlsTransport::drainErrors() const noexcept {
  while (const auto errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS error: {} (handshake {})", std::string_view(errBuf), _handshakeDone ? "done" : "pending");
  }
}

TransportHint TlsTransport::handshake(TransportHint want) {
  if (_handshakeDone) {
    return TransportHint::None;
  }
  const int rc = ::SSL_do_handshake(_ssl.get());
  if (rc == 1) {
    _handshakeDone = true;
    return TransportHint::None;
  }
  const auto hint = classifyFailure(rc, want);
  // A close_notify during the handshake aborts the connection.
  return hint == TransportHint::None ? TransportHint::Error : hint;
}

}  // namespace apirest
