#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_stage.hpp>
#include <array>
#include <cstdint>
#include <expected>

namespace pictor::imaging {

/// Replaces the transparent background by a solid color: the input is
/// composited over a full canvas of `color` using its own alpha as mask.
/// Output is opaque RGB of the same size.
class ColorizeStage : public pictor::core::IImageStage {
 public:
  explicit ColorizeStage(std::array<std::uint8_t, 3> color);

  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  process(const pictor::core::Image& input) override;

  [[nodiscard]] const char* name() const noexcept override { return "colorize"; }

  [[nodiscard]] const std::array<std::uint8_t, 3>& color() const noexcept { return color_; }

 private:
  std::array<std::uint8_t, 3> color_;
};

}  // namespace pictor::imaging
