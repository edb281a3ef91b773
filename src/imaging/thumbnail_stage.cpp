#include <pictor/imaging/thumbnail_stage.hpp>
#include "image_cv_utils.hpp"
#include <pictor/core/geometry.hpp>
#include <opencv2/imgproc.hpp>

namespace pictor::imaging {

namespace {

/// Above this reduction factor an area pre-pass runs before Lanczos.
constexpr int kReducingGap = 2;

}  // namespace

ThumbnailStage::ThumbnailStage(pictor::core::Size bounds) : bounds_(bounds) {}

std::expected<pictor::core::Image, pictor::core::ImageError>
ThumbnailStage::process(const pictor::core::Image& input) {
  using namespace pictor::core;

  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ImageError::InvalidImage);
  }

  const Size target = thumbnail_size(input.width(), input.height(), bounds_);
  if (target.width == input.width() && target.height == input.height()) {
    return input;
  }

  const cv::Size size(static_cast<int>(target.width), static_cast<int>(target.height));
  cv::Mat mat_out;
  if (input.mode() == PixelMode::Palette || input.mode() == PixelMode::Bilevel) {
    cv::resize(*mat_in, mat_out, size, 0, 0, cv::INTER_NEAREST);
  } else {
    cv::Mat reduced = *mat_in;
    if (input.width() > target.width * kReducingGap &&
        input.height() > target.height * kReducingGap) {
      cv::resize(*mat_in, reduced, size * kReducingGap, 0, 0, cv::INTER_AREA);
    }
    cv::resize(reduced, mat_out, size, 0, 0, cv::INTER_LANCZOS4);
  }

  return detail::mat_to_image(mat_out, input.mode(), input);
}

}  // namespace pictor::imaging
