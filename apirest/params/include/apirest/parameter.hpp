#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apirest {

enum class ParamType : uint8_t { String, Int, Bool };

// Validator applied on the raw string value of a parameter, after its type has been checked.
using ParamValidator = std::function<bool(std::string_view)>;

struct Parameter {
  std::string name;
  ParamType type{ParamType::String};
  std::string defaultValue;
  ParamValidator validator;
  std::string description;
};

// Raised when a parameter is unknown or its value does not match its type or validator.
class ParameterError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

[[nodiscard]] std::string_view ParamTypeName(ParamType type) noexcept;

// Accepts 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False.
[[nodiscard]] std::optional<bool> ParseBool(std::string_view str) noexcept;

// Optional sign followed by decimal digits, nothing else.
[[nodiscard]] std::optional<int64_t> ParseInt(std::string_view str) noexcept;

// Dotted-quad IPv4 address.
[[nodiscard]] bool IsIPv4Address(std::string_view str);

[[nodiscard]] ParamValidator IntRangeValidator(int64_t minValue, int64_t maxValue);

}  // namespace apirest
