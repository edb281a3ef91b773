#include <pictor/imaging/mode_convert_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace pictor::imaging {

bool needs_rgb_conversion(const pictor::core::Image& image,
                          pictor::core::ImageFormat format) noexcept {
  using pictor::core::PixelMode;
  if (image.mode() == PixelMode::GrayscaleAlpha) return true;
  if (format == pictor::core::ImageFormat::JPEG) {
    return image.mode() == PixelMode::RGBA || image.mode() == PixelMode::Palette;
  }
  return false;
}

ModeConvertStage::ModeConvertStage(pictor::core::ImageFormat output_format)
    : output_format_(output_format) {}

std::expected<pictor::core::Image, pictor::core::ImageError>
ModeConvertStage::process(const pictor::core::Image& input) {
  using namespace pictor::core;

  if (!input.valid()) {
    return std::unexpected(ImageError::InvalidImage);
  }

  if (!needs_rgb_conversion(input, output_format_)) {
    return input;
  }

  // Alpha is dropped, not composited.
  return detail::mat_to_image(detail::to_rgb(input), PixelMode::RGB, input);
}

}  // namespace pictor::imaging
