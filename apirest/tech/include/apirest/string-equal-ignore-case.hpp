#pragma once

#include <string_view>

namespace apirest {

constexpr char ToLowerAscii(char ch) noexcept { return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + 32) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (ToLowerAscii(lhs[pos]) != ToLowerAscii(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Tells whether a comma separated header value (e.g. 'Connection: keep-alive, Upgrade') contains given token,
// ignoring case and optional whitespace around items.
bool HeaderListContainsToken(std::string_view headerValue, std::string_view token) noexcept;

}  // namespace apirest
