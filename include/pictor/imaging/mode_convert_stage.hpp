#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_format.hpp>
#include <pictor/core/image_stage.hpp>
#include <expected>

namespace pictor::imaging {

/// True when `image` must become plain RGB before encoding to `format`:
/// its mode is not one of Bilevel, Grayscale, Palette, RGB, RGBA, or the
/// target is JPEG and the mode has alpha or a palette.
[[nodiscard]] bool needs_rgb_conversion(const pictor::core::Image& image,
                                        pictor::core::ImageFormat format) noexcept;

/// Normalizes the pixel mode for the output format (see needs_rgb_conversion).
class ModeConvertStage : public pictor::core::IImageStage {
 public:
  explicit ModeConvertStage(pictor::core::ImageFormat output_format);

  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  process(const pictor::core::Image& input) override;

  [[nodiscard]] const char* name() const noexcept override { return "mode_convert"; }

 private:
  pictor::core::ImageFormat output_format_;
};

}  // namespace pictor::imaging
