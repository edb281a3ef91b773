#include <pictor/core/image_header.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace pc = pictor::core;

namespace {

std::vector<std::byte> bytes(std::initializer_list<int> values) {
  std::vector<std::byte> out;
  for (int v : values) out.push_back(static_cast<std::byte>(v));
  return out;
}

void append(std::vector<std::byte>& out, std::initializer_list<int> values) {
  for (int v : values) out.push_back(static_cast<std::byte>(v));
}

std::vector<std::byte> png_header(std::uint32_t w, std::uint32_t h) {
  auto out = bytes({0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0, 0, 13, 'I', 'H', 'D', 'R'});
  append(out, {static_cast<int>(w >> 24), static_cast<int>((w >> 16) & 0xFF),
               static_cast<int>((w >> 8) & 0xFF), static_cast<int>(w & 0xFF)});
  append(out, {static_cast<int>(h >> 24), static_cast<int>((h >> 16) & 0xFF),
               static_cast<int>((h >> 8) & 0xFF), static_cast<int>(h & 0xFF)});
  append(out, {8, 2, 0, 0, 0});
  return out;
}

}  // namespace

TEST(HeaderDimensions, Png) {
  const auto dims = pc::header_dimensions(png_header(10000, 4501));
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 10000u);
  EXPECT_EQ(dims->height, 4501u);
  EXPECT_EQ(dims->pixel_count(), 45'010'000u);
}

TEST(HeaderDimensions, TruncatedPngIsUnknown) {
  auto header = png_header(10, 10);
  header.resize(20);
  EXPECT_FALSE(pc::header_dimensions(header).has_value());
  EXPECT_FALSE(pc::header_dimensions(bytes({0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'})).has_value());
}

TEST(HeaderDimensions, Gif) {
  const auto dims = pc::header_dimensions(bytes({'G', 'I', 'F', '8', '9', 'a', 0x2C, 0x01, 0x90, 0x00}));
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 300u);
  EXPECT_EQ(dims->height, 144u);
}

TEST(HeaderDimensions, BmpTopDownHeight) {
  auto bmp = bytes({'B', 'M', 0, 0, 0, 0, 0, 0, 0, 0, 54, 0, 0, 0,  // file header
                    40, 0, 0, 0,                                   // BITMAPINFOHEADER
                    0x20, 0x03, 0, 0,                              // width 800
                    0xA8, 0xFD, 0xFF, 0xFF});                      // height -600
  const auto dims = pc::header_dimensions(bmp);
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 800u);
  EXPECT_EQ(dims->height, 600u);
}

TEST(HeaderDimensions, JpegSkipsSegmentsBeforeFrame) {
  auto jpeg = bytes({0xFF, 0xD8,
                     0xFF, 0xE0, 0x00, 0x06, 'J', 'F', 'I', 'F',   // APP0, 4 payload bytes
                     0xFF, 0xDB, 0x00, 0x03, 0x00,                 // DQT, 1 payload byte
                     0xFF, 0xC2, 0x00, 0x11, 0x08,                 // progressive SOF
                     0x01, 0xE0,                                   // height 480
                     0x02, 0x80,                                   // width 640
                     0x03});
  const auto dims = pc::header_dimensions(jpeg);
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 640u);
  EXPECT_EQ(dims->height, 480u);
}

TEST(HeaderDimensions, JpegWithoutFrameIsUnknown) {
  EXPECT_FALSE(pc::header_dimensions(bytes({0xFF, 0xD8, 0xFF, 0xDA, 0x00, 0x08})).has_value());
  EXPECT_FALSE(pc::header_dimensions(bytes({0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x40})).has_value());
}

TEST(HeaderDimensions, WebpExtended) {
  auto webp = bytes({'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P',
                     'V', 'P', '8', 'X', 10, 0, 0, 0, 0, 0, 0, 0,
                     0x1F, 0x03, 0x00,   // width - 1 = 799
                     0x57, 0x02, 0x00}); // height - 1 = 599
  const auto dims = pc::header_dimensions(webp);
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 800u);
  EXPECT_EQ(dims->height, 600u);
}

TEST(HeaderDimensions, UnknownFormats) {
  EXPECT_FALSE(pc::header_dimensions({}).has_value());
  EXPECT_FALSE(pc::header_dimensions(bytes({'I', 'I', '*', 0, 8, 0, 0, 0})).has_value());
  EXPECT_FALSE(pc::header_dimensions(bytes({'h', 'e', 'l', 'l', 'o'})).has_value());
}
