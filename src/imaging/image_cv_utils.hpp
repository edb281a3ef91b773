#pragma once

#include <pictor/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace pictor::imaging::detail {

/// View an Image's raw channels as a cv::Mat (no copy; palette images give
/// the index plane). Returns nullopt if the buffer does not fit the mode.
std::optional<cv::Mat> image_to_mat(const pictor::core::Image& image);

/// Copy a cv::Mat into a new Image with the given mode, keeping the
/// intrinsic format (and palette, for Palette mode) of `like`.
pictor::core::Image mat_to_image(const cv::Mat& mat,
                                 pictor::core::PixelMode mode,
                                 const pictor::core::Image& like);

/// Color channels as CV_8UC3 RGB (palette expanded, gray replicated,
/// alpha dropped). Empty Mat if the image is invalid.
cv::Mat to_rgb(const pictor::core::Image& image);

/// Alpha plane as CV_8UC1; fully opaque (255) when the mode has no alpha.
cv::Mat alpha_plane(const pictor::core::Image& image);

}  // namespace pictor::imaging::detail
