#include "apirest/base64.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

namespace apirest {

TEST(Base64, EncodeEmpty) { EXPECT_EQ(B64Encode(std::string_view("")), ""); }
TEST(Base64, Encode1) { EXPECT_EQ(B64Encode(std::string_view("f")), "Zg=="); }
TEST(Base64, Encode2) { EXPECT_EQ(B64Encode(std::string_view("fo")), "Zm8="); }
TEST(Base64, Encode3) { EXPECT_EQ(B64Encode(std::string_view("foo")), "Zm9v"); }
TEST(Base64, EncodeCredentials) { EXPECT_EQ(B64Encode(std::string_view("admin:secret")), "YWRtaW46c2VjcmV0"); }

TEST(Base64, DecodeCredentials) { EXPECT_EQ(B64Decode(std::string_view("YWRtaW46c2VjcmV0")), "admin:secret"); }

TEST(Base64, DecodeWithWhitespace) {
  EXPECT_EQ(B64Decode(std::string_view("Zm9v YmFy")), "foobar");
  EXPECT_EQ(B64Decode(std::string_view(" Zm9vYmFy\n")), "foobar");
}

TEST(Base64, DecodeNoPadding) {
  EXPECT_EQ(B64Decode(std::string_view("Zg")), "f");
  EXPECT_EQ(B64Decode(std::string_view("Zm8")), "fo");
}

TEST(Base64, DecodeInvalidCharacter) {
  EXPECT_THROW((void)B64Decode(std::string_view("Zm9v@YmFy")), std::invalid_argument);
  EXPECT_THROW((void)B64Decode(std::string_view("\xC3\xA9")), std::invalid_argument);
}

TEST(Base64, DecodeBinary) {
  const std::string_view bin("\x00\xFF\x10", 3);
  EXPECT_EQ(B64Decode(B64Encode(bin)), bin);
}

}  // namespace apirest
