#include "apirest/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace apirest {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

}  // namespace

TEST(BaseFd, ClosesOnDestruction) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  {
    BaseFd fd(raw);
    EXPECT_TRUE(fd);
    EXPECT_EQ(fd.fd(), raw);
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  BaseFd first(raw);
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), raw);
  second.close();
  second.close();
  EXPECT_FALSE(second);
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFd, ReleaseDoesNotClose) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  {
    BaseFd fd(raw);
    EXPECT_EQ(fd.release(), raw);
  }
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);
}

}  // namespace apirest
