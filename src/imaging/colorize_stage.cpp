#include <pictor/imaging/colorize_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace pictor::imaging {

ColorizeStage::ColorizeStage(std::array<std::uint8_t, 3> color) : color_(color) {}

std::expected<pictor::core::Image, pictor::core::ImageError>
ColorizeStage::process(const pictor::core::Image& input) {
  using namespace pictor::core;

  const cv::Mat rgb = detail::to_rgb(input);
  if (rgb.empty()) {
    return std::unexpected(ImageError::InvalidImage);
  }
  const cv::Mat canvas(rgb.size(), CV_8UC3, cv::Scalar(color_[0], color_[1], color_[2]));

  cv::Mat mat_out;
  if (!input.has_alpha()) {
    // Opaque mask: the image covers the whole canvas.
    mat_out = rgb;
  } else {
    cv::Mat weights;
    detail::alpha_plane(input).convertTo(weights, CV_32F, 1.0 / 255.0);
    const cv::Mat canvas_weights = 1.0 - weights;
    cv::blendLinear(rgb, canvas, weights, canvas_weights, mat_out);
  }

  return detail::mat_to_image(mat_out, PixelMode::RGB, input);
}

}  // namespace pictor::imaging
