#pragma once

#include <string>
#include <string_view>

namespace apirest {

// Expands a leading '~' with the HOME directory, then makes the path absolute against the current directory.
// An empty path is returned unchanged.
// Throws std::invalid_argument if '~' expansion is requested while HOME is not set, or if the current directory
// cannot be determined (e.g. it was removed) for a relative path.
[[nodiscard]] std::string ExpandPath(std::string_view path);

}  // namespace apirest
