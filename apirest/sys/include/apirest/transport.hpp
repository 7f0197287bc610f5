#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace apirest {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation returns EAGAIN/WANT.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed)
  ReadReady,   // Need socket readable before operation can proceed
  WriteReady,  // Need socket writable before operation can proceed
  Error
};

// Base transport abstraction; allows transparent TLS or plain socket IO.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  // Non-blocking read. bytesProcessed == 0 with want == None means orderly close.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write of as much data as possible.
  virtual TransportResult write(std::string_view data) = 0;

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }
};

// Plain transport directly operates on a non-blocking fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace apirest
