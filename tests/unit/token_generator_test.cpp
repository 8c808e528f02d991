#include <set>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "dropguard/token_generator.hpp"

namespace {
bool IsLowerHex(const std::string& value) {
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}
}  // namespace

TEST(TokenGeneratorTest, DefaultLengthIsSixtyFourHexChars) {
  auto token = dropguard::GenerateToken();
  EXPECT_EQ(token.size(), 64u);
  EXPECT_TRUE(IsLowerHex(token));
}

TEST(TokenGeneratorTest, CustomLengthDoublesByteCount) {
  EXPECT_EQ(dropguard::GenerateToken(1).size(), 2u);
  EXPECT_EQ(dropguard::GenerateToken(16).size(), 32u);
}

TEST(TokenGeneratorTest, ZeroLengthRejected) {
  EXPECT_THROW(dropguard::GenerateToken(0), std::invalid_argument);
}

TEST(TokenGeneratorTest, TokensDoNotRepeat) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(seen.insert(dropguard::GenerateToken()).second);
  }
}

TEST(TokenGeneratorTest, BytesToHexPadsEachByte) {
  const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
  EXPECT_EQ(dropguard::BytesToHex(bytes, sizeof(bytes)), "000fa0ff");
}
