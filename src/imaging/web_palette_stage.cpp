#include <pictor/imaging/web_palette_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

namespace pictor::imaging {

namespace {

constexpr int kLevels = 6;
constexpr int kLevelStep = 51;  // 255 / (kLevels - 1)

std::vector<pictor::core::PaletteEntry> make_web_palette() {
  std::vector<pictor::core::PaletteEntry> palette(256, pictor::core::PaletteEntry{0, 0, 0});
  for (int r = 0; r < kLevels; ++r) {
    for (int g = 0; g < kLevels; ++g) {
      for (int b = 0; b < kLevels; ++b) {
        palette[static_cast<std::size_t>(r * 36 + g * 6 + b)] = {
            static_cast<std::uint8_t>(r * kLevelStep),
            static_cast<std::uint8_t>(g * kLevelStep),
            static_cast<std::uint8_t>(b * kLevelStep)};
      }
    }
  }
  return palette;
}

/// Nearest cube level of a channel value (0..5).
int nearest_level(int v) {
  return std::clamp((v + kLevelStep / 2) / kLevelStep, 0, kLevels - 1);
}

/// Floyd-Steinberg error diffusion onto the web cube; returns the index plane.
cv::Mat dither_to_web_palette(const cv::Mat& rgb) {
  const int w = rgb.cols;
  const int h = rgb.rows;
  cv::Mat indices(h, w, CV_8UC1);

  // Accumulated error for the current and the next row, 3 channels each,
  // with one pixel of padding on both sides.
  std::vector<int> current(static_cast<std::size_t>(w + 2) * 3, 0);
  std::vector<int> next(current.size(), 0);

  for (int y = 0; y < h; ++y) {
    const auto* src = rgb.ptr<cv::Vec3b>(y);
    auto* dst = indices.ptr<std::uint8_t>(y);
    std::fill(next.begin(), next.end(), 0);

    for (int x = 0; x < w; ++x) {
      std::array<int, 3> level{};
      for (int c = 0; c < 3; ++c) {
        const std::size_t at = static_cast<std::size_t>(x + 1) * 3 + c;
        const int wanted = std::clamp(src[x][c] + current[at] / 16, 0, 255);
        level[c] = nearest_level(wanted);
        const int err = wanted - level[c] * kLevelStep;

        current[at + 3] += err * 7;
        next[at - 3] += err * 3;
        next[at] += err * 5;
        next[at + 3] += err;
      }
      dst[x] = static_cast<std::uint8_t>(level[0] * 36 + level[1] * 6 + level[2]);
    }
    std::swap(current, next);
  }
  return indices;
}

}  // namespace

const std::vector<pictor::core::PaletteEntry>& web_palette() {
  static const std::vector<pictor::core::PaletteEntry> palette = make_web_palette();
  return palette;
}

std::expected<pictor::core::Image, pictor::core::ImageError>
WebPaletteStage::process(const pictor::core::Image& input) {
  using namespace pictor::core;

  if (!input.valid()) {
    return std::unexpected(ImageError::InvalidImage);
  }

  if (input.mode() == PixelMode::Palette) {
    return input;
  }

  const cv::Mat alpha = input.has_alpha() ? detail::alpha_plane(input) : cv::Mat();
  const cv::Mat indices = dither_to_web_palette(detail::to_rgb(input));

  Image paletted = detail::mat_to_image(indices, PixelMode::Palette, input);
  paletted.set_palette(web_palette());
  if (alpha.empty()) {
    return paletted;
  }

  std::vector<cv::Mat> channels;
  cv::split(detail::to_rgb(paletted), channels);
  channels.push_back(alpha);
  cv::Mat rgba;
  cv::merge(channels, rgba);
  return detail::mat_to_image(rgba, PixelMode::RGBA, input);
}

}  // namespace pictor::imaging
