#include <pictor/imaging/crop_stage.hpp>
#include "image_cv_utils.hpp"
#include <pictor/core/geometry.hpp>
#include <opencv2/core.hpp>

namespace pictor::imaging {

CropStage::CropStage(pictor::core::Size asked, pictor::core::CropMode mode)
    : asked_(asked), mode_(mode) {}

std::expected<pictor::core::Image, pictor::core::ImageError>
CropStage::process(const pictor::core::Image& input) {
  using namespace pictor::core;

  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ImageError::InvalidImage);
  }

  const CropWindow window = crop_window(input.width(), input.height(), asked_, mode_);
  if (window.width == input.width() && window.height == input.height()) {
    return input;
  }

  const cv::Rect roi(static_cast<int>(window.x), static_cast<int>(window.y),
                     static_cast<int>(window.width), static_cast<int>(window.height));
  return detail::mat_to_image((*mat_in)(roi), input.mode(), input);
}

}  // namespace pictor::imaging
