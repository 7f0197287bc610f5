#include "apirest/string-equal-ignore-case.hpp"

#include <string_view>

#include "apirest/string-trim.hpp"

namespace apirest {

bool HeaderListContainsToken(std::string_view headerValue, std::string_view token) noexcept {
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    if (CaseInsensitiveEqual(TrimOws(headerValue.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace apirest
