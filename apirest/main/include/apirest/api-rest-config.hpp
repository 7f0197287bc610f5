#pragma once

#include <cstdint>
#include <string>

namespace apirest {

// Immutable snapshot of the service configuration, resolved once per start attempt.
struct ApiRestConfig {
  // TLS is served only when both paths are set.
  [[nodiscard]] bool isTls() const noexcept { return !certFile.empty() && !keyFile.empty(); }

  // Authentication is enabled only when both credentials are set. A single credential silently disables it.
  [[nodiscard]] bool authEnabled() const noexcept { return !username.empty() && !password.empty(); }

  std::string address{"127.0.0.1"};
  uint16_t port{8081};
  std::string allowOrigin{"*"};
  std::string certFile;
  std::string keyFile;
  std::string username;
  std::string password;
  bool useWebsocket{false};
};

}  // namespace apirest
