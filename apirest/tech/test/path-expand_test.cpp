#include "apirest/path-expand.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <stdexcept>

#include "apirest/scoped-env-var.hpp"
#include "apirest/temp-file.hpp"

namespace apirest {

TEST(ExpandPath, EmptyStaysEmpty) { EXPECT_EQ(ExpandPath(""), ""); }

TEST(ExpandPath, AbsoluteIsNormalized) { EXPECT_EQ(ExpandPath("/etc/./ssl//certs/"), "/etc/ssl/certs/"); }

TEST(ExpandPath, RelativeBecomesAbsolute) {
  const auto expected = (std::filesystem::current_path() / "cert.pem").string();
  EXPECT_EQ(ExpandPath("cert.pem"), expected);
}

TEST(ExpandPath, RelativeWithRemovedCurrentDirectoryThrows) {
  auto dir = std::make_unique<test::ScopedTempDir>();
  test::ScopedCurrentPath cwd(dir->dirPath());
  dir.reset();
  EXPECT_THROW((void)ExpandPath("cert.pem"), std::invalid_argument);
  // absolute paths do not depend on the current directory
  EXPECT_EQ(ExpandPath("/etc/cert.pem"), "/etc/cert.pem");
}

TEST(ExpandPath, TildeUsesHome) {
  test::ScopedEnvVar home("HOME", "/home/operator");
  EXPECT_EQ(ExpandPath("~/.apirest/key.pem"), "/home/operator/.apirest/key.pem");
  EXPECT_EQ(ExpandPath("~"), "/home/operator");
}

TEST(ExpandPath, TildeInsideNameIsLiteral) {
  test::ScopedEnvVar home("HOME", "/home/operator");
  EXPECT_EQ(ExpandPath("/tmp/~backup"), "/tmp/~backup");
}

TEST(ExpandPath, TildeWithoutHomeThrows) {
  test::ScopedEnvVar home("HOME", nullptr);
  EXPECT_THROW((void)ExpandPath("~/cert.pem"), std::invalid_argument);
}

}  // namespace apirest
