#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace apirest::test {

// Creates a unique temporary directory under the system temp directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "apirest-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Full path (as string) of a file directly under this directory. The file is not created.
  [[nodiscard]] std::string pathOf(std::string_view filename) const { return (_dir / filename).string(); }

 private:
  std::filesystem::path _dir;
};

// Makes given directory the current one, and restores the previous current directory on destruction.
class ScopedCurrentPath {
 public:
  explicit ScopedCurrentPath(const std::filesystem::path& dir);

  ScopedCurrentPath(const ScopedCurrentPath&) = delete;
  ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

  ~ScopedCurrentPath();

 private:
  std::filesystem::path _previous;
};

// Write the whole content into given file (truncating it). Throws std::runtime_error on failure.
void WriteFile(const std::filesystem::path& path, std::string_view content);

// Read a whole file. Throws std::runtime_error on failure.
[[nodiscard]] std::string ReadFile(const std::filesystem::path& path);

}  // namespace apirest::test
