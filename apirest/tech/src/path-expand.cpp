#include "apirest/path-expand.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace apirest {

std::string ExpandPath(std::string_view path) {
  if (path.empty()) {
    return {};
  }
  std::string expanded;
  if (path.front() == '~' && (path.size() == 1 || path[1] == '/')) {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
      throw std::invalid_argument(std::format("cannot expand '{}': HOME is not set", path));
    }
    expanded.assign(home);
    expanded.append(path.substr(1));
  } else {
    expanded.assign(path);
  }
  std::error_code ec;
  const auto absolutePath = std::filesystem::absolute(expanded, ec);
  if (ec) {
    throw std::invalid_argument(std::format("cannot make '{}' absolute: {}", path, ec.message()));
  }
  return absolutePath.lexically_normal().string();
}

}  // namespace apirest
