#include "apirest/base64.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apirest {

namespace {

constexpr std::string_view kB64Table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kB64NbBits = 6;
constexpr uint32_t kMask6 = (1U << kB64NbBits) - 1U;
constexpr unsigned char kInvalid = 64;

constexpr unsigned char ReverseB64(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<unsigned char>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<unsigned char>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<unsigned char>(ch - '0' + 52);
  }
  if (ch == '+') {
    return 62;
  }
  if (ch == '/') {
    return 63;
  }
  return kInvalid;
}

}  // namespace

std::string B64Encode(std::string_view binData) {
  std::string ret;
  ret.reserve(((binData.size() + 2) / 3) * 4);

  int bitsCollected{};
  uint32_t accumulator{};
  for (char ch : binData) {
    accumulator = (accumulator << 8) | static_cast<uint8_t>(ch);
    bitsCollected += 8;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      ret.push_back(kB64Table[(accumulator >> bitsCollected) & kMask6]);
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    ret.push_back(kB64Table[accumulator & kMask6]);
  }
  while (ret.size() % 4 != 0) {
    ret.push_back('=');
  }
  return ret;
}

std::string B64Decode(std::string_view ascData) {
  std::string ret;
  ret.reserve((ascData.size() * 3) / 4);
  int bitsCollected = 0;
  uint32_t accumulator = 0;

  for (char ch : ascData) {
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '=') {
      continue;
    }
    const auto value = ReverseB64(ch);
    if (value == kInvalid) {
      throw std::invalid_argument("Illegal character detected for a base 64 encoded string");
    }
    accumulator = (accumulator << kB64NbBits) | value;
    bitsCollected += kB64NbBits;
    if (bitsCollected >= 8) {
      bitsCollected -= 8;
      ret.push_back(static_cast<char>((accumulator >> bitsCollected) & 0xFFU));
    }
  }
  return ret;
}

}  // namespace apirest
