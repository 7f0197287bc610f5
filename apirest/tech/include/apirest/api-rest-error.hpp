#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apirest {

// Reasons for which the REST API service refuses to start.
enum class ApiRestErrc : uint8_t { AlreadyStarted, InvalidConfiguration, TlsBootstrapFailed, BindFailed };

[[nodiscard]] std::string_view ApiRestErrcName(ApiRestErrc code) noexcept;

// Synchronous start-time failure. The service stays (or goes back to) idle when it is thrown.
class ApiRestError : public std::runtime_error {
 public:
  ApiRestError(ApiRestErrc code, const std::string& what) : std::runtime_error(what), _code(code) {}

  [[nodiscard]] ApiRestErrc code() const noexcept { return _code; }

 private:
  ApiRestErrc _code;
};

}  // namespace apirest
