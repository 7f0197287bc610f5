#include "apirest/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "apirest/base-fd.hpp"
#include "apirest/errno-throw.hpp"
#include "apirest/log.hpp"

namespace apirest {

namespace {

constexpr int ToSysType(Socket::Type type) {
  return type == Socket::Type::StreamNonBlock ? SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC
                                              : SOCK_STREAM | SOCK_CLOEXEC;
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSysType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view address, uint16_t& port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string addressStr(address);
  if (::inet_pton(AF_INET, addressStr.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument(std::format("'{}' is not a valid IPv4 address", address));
  }

  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed on {}:{}", address, port);
  }
  if (::listen(fd(), SOMAXCONN) == -1) {
    throw_errno("listen failed on {}:{}", address, port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
}

}  // namespace apirest
