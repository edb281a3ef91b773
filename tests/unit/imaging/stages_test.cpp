#include <pictor/core/image.hpp>
#include <pictor/imaging/colorize_stage.hpp>
#include <pictor/imaging/crop_stage.hpp>
#include <pictor/imaging/mode_convert_stage.hpp>
#include <pictor/imaging/thumbnail_stage.hpp>
#include <pictor/imaging/web_palette_stage.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <set>
#include <vector>

namespace pc = pictor::core;
namespace pi = pictor::imaging;
namespace pt = pictor::testing;

namespace {

/// Grayscale image whose value is the column index (mod 256).
pc::Image column_ramp(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      buf[static_cast<std::size_t>(y) * w + x] = static_cast<std::byte>(x % 256);
    }
  }
  return pc::Image(w, h, pc::PixelMode::Grayscale, pc::ImageFormat::JPEG, std::move(buf));
}

}  // namespace

TEST(CropStage, KeepsCenteredColumns) {
  pi::CropStage stage({100, 200}, pc::CropMode::Top);
  auto out = stage.process(column_ramp(300, 300));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 150u);
  EXPECT_EQ(out->height(), 300u);
  EXPECT_EQ(pt::pixel(*out, 0, 0), 75);
  EXPECT_EQ(pt::pixel(*out, 149, 299), 224);
  EXPECT_EQ(out->format(), pc::ImageFormat::JPEG);
}

TEST(CropStage, SameRatioIsNoOp) {
  pi::CropStage stage({50, 25}, pc::CropMode::Center);
  auto out = stage.process(column_ramp(200, 100));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 200u);
  EXPECT_EQ(out->height(), 100u);
}

TEST(CropStage, RejectsInvalidImage) {
  pi::CropStage stage({10, 10}, pc::CropMode::Center);
  auto out = stage.process(pc::Image());
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::ImageError::InvalidImage);
}

TEST(ThumbnailStage, ShrinksKeepingRatio) {
  pi::ThumbnailStage stage({500, 250});
  auto out = stage.process(pt::solid_rgb(2000, 1000, 10, 20, 30));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 500u);
  EXPECT_EQ(out->height(), 250u);
  EXPECT_EQ(out->mode(), pc::PixelMode::RGB);
  EXPECT_NEAR(pt::pixel(*out, 250, 125, 0), 10, 1);
  EXPECT_NEAR(pt::pixel(*out, 250, 125, 2), 30, 1);
}

TEST(ThumbnailStage, NeverUpscales) {
  pi::ThumbnailStage stage({1024, 1024});
  auto out = stage.process(pt::solid_rgb(40, 30, 1, 1, 1));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 40u);
  EXPECT_EQ(out->height(), 30u);
}

TEST(ThumbnailStage, PaletteIndicesStayInPalette) {
  std::vector<std::byte> buf(64 * 64);
  for (std::size_t i = 0; i < buf.size(); ++i) buf[i] = std::byte{(i % 2) ? 1 : 0};
  pc::Image paletted(64, 64, pc::PixelMode::Palette, pc::ImageFormat::GIF, std::move(buf));
  paletted.set_palette({{0, 0, 0}, {255, 255, 255}});

  pi::ThumbnailStage stage({16, 16});
  auto out = stage.process(paletted);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::Palette);
  EXPECT_EQ(out->palette().size(), 2u);
  for (const std::byte b : out->data()) {
    EXPECT_LE(std::to_integer<int>(b), 1);
  }
}

TEST(ColorizeStage, TransparentImageBecomesBackground) {
  pi::ColorizeStage stage({32, 128, 224});
  auto out = stage.process(pt::solid_rgba(8, 6, 255, 0, 0, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::RGB);
  EXPECT_FALSE(out->has_alpha());
  EXPECT_EQ(out->width(), 8u);
  EXPECT_EQ(out->height(), 6u);
  for (std::uint32_t y = 0; y < 6; ++y) {
    for (std::uint32_t x = 0; x < 8; ++x) {
      EXPECT_EQ(pt::pixel(*out, x, y, 0), 32);
      EXPECT_EQ(pt::pixel(*out, x, y, 1), 128);
      EXPECT_EQ(pt::pixel(*out, x, y, 2), 224);
    }
  }
}

TEST(ColorizeStage, OpaqueImageCoversBackground) {
  pi::ColorizeStage stage({32, 32, 32});
  auto out = stage.process(pt::solid_rgba(4, 4, 200, 100, 50, 255));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel(*out, 1, 1, 0), 200);
  EXPECT_EQ(pt::pixel(*out, 1, 1, 1), 100);
  EXPECT_EQ(pt::pixel(*out, 1, 1, 2), 50);
}

TEST(ColorizeStage, HalfTransparentBlends) {
  pi::ColorizeStage stage({0, 0, 0});
  auto out = stage.process(pt::solid_rgba(2, 2, 200, 100, 0, 128));
  ASSERT_TRUE(out.has_value());
  EXPECT_NEAR(pt::pixel(*out, 0, 0, 0), 100, 1);
  EXPECT_NEAR(pt::pixel(*out, 0, 0, 1), 50, 1);
}

TEST(ColorizeStage, ImageWithoutAlphaIsKept) {
  pi::ColorizeStage stage({224, 224, 224});
  auto out = stage.process(pt::solid_rgb(3, 3, 9, 8, 7));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel(*out, 2, 2, 0), 9);
  EXPECT_EQ(pt::pixel(*out, 2, 2, 2), 7);
}

TEST(WebPalette, CubeLayout) {
  const auto& palette = pi::web_palette();
  ASSERT_EQ(palette.size(), 256u);
  EXPECT_EQ(palette[0], (pc::PaletteEntry{0, 0, 0}));
  EXPECT_EQ(palette[215], (pc::PaletteEntry{255, 255, 255}));
  EXPECT_EQ(palette[51], (pc::PaletteEntry{51, 102, 153}));
}

TEST(WebPaletteStage, CubeColorMapsExactly) {
  pi::WebPaletteStage stage;
  auto out = stage.process(pt::solid_rgb(5, 5, 51, 102, 153));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::Palette);
  EXPECT_EQ(out->palette().size(), 256u);
  for (const std::byte b : out->data()) {
    EXPECT_EQ(std::to_integer<int>(b), 51);
  }
}

TEST(WebPaletteStage, DitheringPreservesAverage) {
  pi::WebPaletteStage stage;
  auto out = stage.process(pt::solid_rgb(32, 32, 25, 25, 25));
  ASSERT_TRUE(out.has_value());
  std::set<int> indices;
  double sum = 0;
  for (const std::byte b : out->data()) {
    const int idx = std::to_integer<int>(b);
    indices.insert(idx);
    sum += out->palette()[static_cast<std::size_t>(idx)][0];
  }
  EXPECT_GT(indices.size(), 1u);
  EXPECT_NEAR(sum / static_cast<double>(out->size_bytes()), 25.0, 3.0);
}

TEST(WebPaletteStage, AlphaIsReapplied) {
  pi::WebPaletteStage stage;
  auto out = stage.process(pt::solid_rgba(4, 4, 51, 102, 153, 77));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::RGBA);
  EXPECT_EQ(pt::pixel(*out, 3, 3, 0), 51);
  EXPECT_EQ(pt::pixel(*out, 3, 3, 2), 153);
  EXPECT_EQ(pt::pixel(*out, 3, 3, 3), 77);
}

TEST(WebPaletteStage, PaletteInputPassesThrough) {
  std::vector<std::byte> buf(4, std::byte{1});
  pc::Image paletted(2, 2, pc::PixelMode::Palette, pc::ImageFormat::GIF, std::move(buf));
  paletted.set_palette({{1, 2, 3}, {4, 5, 6}});
  pi::WebPaletteStage stage;
  auto out = stage.process(paletted);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::Palette);
  EXPECT_EQ(out->palette().size(), 2u);
}

TEST(ModeConvert, NeedsRgbConversion) {
  const pc::Image rgba = pt::solid_rgba(1, 1, 0, 0, 0, 0);
  const pc::Image rgb = pt::solid_rgb(1, 1, 0, 0, 0);
  pc::Image gray_alpha(1, 1, pc::PixelMode::GrayscaleAlpha, pc::ImageFormat::PNG,
                       std::vector<std::byte>(2));
  pc::Image paletted(1, 1, pc::PixelMode::Palette, pc::ImageFormat::GIF,
                     std::vector<std::byte>(1));
  paletted.set_palette({{0, 0, 0}});

  EXPECT_TRUE(pi::needs_rgb_conversion(rgba, pc::ImageFormat::JPEG));
  EXPECT_FALSE(pi::needs_rgb_conversion(rgba, pc::ImageFormat::PNG));
  EXPECT_FALSE(pi::needs_rgb_conversion(rgb, pc::ImageFormat::JPEG));
  EXPECT_TRUE(pi::needs_rgb_conversion(gray_alpha, pc::ImageFormat::PNG));
  EXPECT_TRUE(pi::needs_rgb_conversion(paletted, pc::ImageFormat::JPEG));
  EXPECT_FALSE(pi::needs_rgb_conversion(paletted, pc::ImageFormat::GIF));
}

TEST(ModeConvertStage, DropsAlphaForJpeg) {
  pi::ModeConvertStage stage(pc::ImageFormat::JPEG);
  auto out = stage.process(pt::solid_rgba(3, 2, 10, 20, 30, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::RGB);
  EXPECT_EQ(pt::pixel(*out, 2, 1, 0), 10);
  EXPECT_EQ(pt::pixel(*out, 2, 1, 2), 30);
}

TEST(ModeConvertStage, GrayscaleAlphaBecomesRgb) {
  std::vector<std::byte> buf = {std::byte{90}, std::byte{10}};
  pc::Image gray_alpha(1, 1, pc::PixelMode::GrayscaleAlpha, pc::ImageFormat::PNG, std::move(buf));
  pi::ModeConvertStage stage(pc::ImageFormat::PNG);
  auto out = stage.process(gray_alpha);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::RGB);
  EXPECT_EQ(pt::pixel(*out, 0, 0, 0), 90);
  EXPECT_EQ(pt::pixel(*out, 0, 0, 1), 90);
}

TEST(ModeConvertStage, KeepsAllowedModes) {
  pi::ModeConvertStage stage(pc::ImageFormat::PNG);
  auto out = stage.process(pt::solid_rgba(2, 2, 1, 2, 3, 4));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->mode(), pc::PixelMode::RGBA);
}
