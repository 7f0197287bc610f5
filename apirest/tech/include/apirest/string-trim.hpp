#pragma once

#include <string_view>

namespace apirest {

inline constexpr std::string_view kOwsChars = " \t";

// Strips leading and trailing optional whitespace (SP and HTAB, RFC 9110 section 5.6.3).
// Other control characters such as CR or LF are kept.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(kOwsChars);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(kOwsChars) - first + 1);
}

}  // namespace apirest
