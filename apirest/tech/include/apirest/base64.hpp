#pragma once

#include <string>
#include <string_view>

namespace apirest {

[[nodiscard]] std::string B64Encode(std::string_view binData);

// Decodes a base64 encoded string, skipping whitespace and padding.
// Throws std::invalid_argument on illegal characters.
[[nodiscard]] std::string B64Decode(std::string_view ascData);

}  // namespace apirest
