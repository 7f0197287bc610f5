#pragma once

#include <cstdint>
#include <string_view>

#include "apirest/base-fd.hpp"

namespace apirest {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to the given IPv4 address and port and start listening.
  // If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::invalid_argument if address is not a valid IPv4 address,
  // std::system_error if the address cannot be bound.
  void bindAndListen(std::string_view address, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace apirest
