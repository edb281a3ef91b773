#include <pictor/core/base64.hpp>
#include <pictor/core/error.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pc = pictor::core;

namespace {

std::vector<std::byte> bytes_of(const std::string& s) {
  std::vector<std::byte> out;
  for (char c : s) out.push_back(static_cast<std::byte>(c));
  return out;
}

}  // namespace

TEST(Base64, EncodeKnownVectors) {
  EXPECT_EQ(pc::base64_encode(bytes_of("")), "");
  EXPECT_EQ(pc::base64_encode(bytes_of("f")), "Zg==");
  EXPECT_EQ(pc::base64_encode(bytes_of("fo")), "Zm8=");
  EXPECT_EQ(pc::base64_encode(bytes_of("foo")), "Zm9v");
  EXPECT_EQ(pc::base64_encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64, DecodeKnownVectors) {
  auto one = pc::base64_decode("Zg==");
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(*one, bytes_of("f"));

  auto six = pc::base64_decode("Zm9vYmFy");
  ASSERT_TRUE(six.has_value());
  EXPECT_EQ(*six, bytes_of("foobar"));
}

TEST(Base64, DecodeSkipsLineBreaks) {
  auto r = pc::base64_decode("Zm9v\r\nYmFy\n");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, bytes_of("foobar"));
}

TEST(Base64, DecodeRejectsForeignCharacters) {
  auto r = pc::base64_decode("Zm9v!mFy");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::ImageError::InvalidBase64);
}

TEST(Base64, DecodeRejectsMissingPadding) {
  EXPECT_FALSE(pc::base64_decode("Zg").has_value());
  EXPECT_FALSE(pc::base64_decode("Zm8").has_value());
}

TEST(Base64, DecodeRejectsMisplacedPadding) {
  EXPECT_FALSE(pc::base64_decode("Z===").has_value());
  EXPECT_FALSE(pc::base64_decode("Zg==Zg==").has_value());
  EXPECT_FALSE(pc::base64_decode("Zm9v=").has_value());
}

TEST(Base64, BinaryBytesSurvive) {
  std::vector<std::byte> all;
  for (int i = 0; i < 256; ++i) all.push_back(static_cast<std::byte>(i));
  auto r = pc::base64_decode(pc::base64_encode(all));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, all);
}
