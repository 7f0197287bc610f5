#include "apirest/api-rest-error.hpp"

#include <string_view>

namespace apirest {

std::string_view ApiRestErrcName(ApiRestErrc code) noexcept {
  switch (code) {
    case ApiRestErrc::AlreadyStarted:
      return "AlreadyStarted";
    case ApiRestErrc::InvalidConfiguration:
      return "InvalidConfiguration";
    case ApiRestErrc::TlsBootstrapFailed:
      return "TlsBootstrapFailed";
    case ApiRestErrc::BindFailed:
      return "BindFailed";
  }
  return "Unknown";
}

}  // namespace apirest
