#include "apirest/parameter.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace apirest {

std::string_view ParamTypeName(ParamType type) noexcept {
  switch (type) {
    case ParamType::String:
      return "string";
    case ParamType::Int:
      return "integer";
    case ParamType::Bool:
      return "boolean";
    default:
      return "unknown";
  }
}

std::optional<bool> ParseBool(std::string_view str) noexcept {
  if (str == "1" || str == "t" || str == "T" || str == "TRUE" || str == "true" || str == "True") {
    return true;
  }
  if (str == "0" || str == "f" || str == "F" || str == "FALSE" || str == "false" || str == "False") {
    return false;
  }
  return std::nullopt;
}

std::optional<int64_t> ParseInt(std::string_view str) noexcept {
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
    if (!str.empty() && str.front() == '-') {
      return std::nullopt;
    }
  }
  if (str.empty()) {
    return std::nullopt;
  }
  int64_t value{};
  const auto* last = str.data() + str.size();
  const auto [ptr, ec] = std::from_chars(str.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool IsIPv4Address(std::string_view str) {
  in_addr addr{};
  const std::string asStr(str);
  return ::inet_pton(AF_INET, asStr.c_str(), &addr) == 1;
}

ParamValidator IntRangeValidator(int64_t minValue, int64_t maxValue) {
  return [minValue, maxValue](std::string_view str) {
    const auto value = ParseInt(str);
    return value && *value >= minValue && *value <= maxValue;
  };
}

}  // namespace apirest
