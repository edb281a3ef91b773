#include "image_cv_utils.hpp"
#include <pictor/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace pictor::imaging::detail {

namespace pc = pictor::core;

std::optional<cv::Mat> image_to_mat(const pc::Image& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* ptr = const_cast<std::byte*>(image.data().data());

  switch (image.mode()) {
    case pc::PixelMode::Bilevel:
    case pc::PixelMode::Grayscale:
    case pc::PixelMode::Palette:
      return cv::Mat(h, w, CV_8UC1, ptr);
    case pc::PixelMode::GrayscaleAlpha:
      return cv::Mat(h, w, CV_8UC2, ptr);
    case pc::PixelMode::RGB:
      return cv::Mat(h, w, CV_8UC3, ptr);
    case pc::PixelMode::RGBA:
      return cv::Mat(h, w, CV_8UC4, ptr);
  }
  return std::nullopt;
}

pc::Image mat_to_image(const cv::Mat& mat, pc::PixelMode mode, const pc::Image& like) {
  if (mat.empty()) return pc::Image();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  pc::Image out(static_cast<std::uint32_t>(packed.cols),
                static_cast<std::uint32_t>(packed.rows),
                mode, like.format(), std::move(buffer));
  if (mode == pc::PixelMode::Palette) out.set_palette(like.palette());
  return out;
}

cv::Mat to_rgb(const pc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return cv::Mat();

  cv::Mat rgb;
  switch (image.mode()) {
    case pc::PixelMode::Bilevel:
    case pc::PixelMode::Grayscale:
      cv::cvtColor(*mat, rgb, cv::COLOR_GRAY2RGB);
      break;
    case pc::PixelMode::GrayscaleAlpha: {
      cv::Mat gray;
      cv::extractChannel(*mat, gray, 0);
      cv::cvtColor(gray, rgb, cv::COLOR_GRAY2RGB);
      break;
    }
    case pc::PixelMode::Palette: {
      const auto& palette = image.palette();
      rgb.create(mat->rows, mat->cols, CV_8UC3);
      for (int y = 0; y < mat->rows; ++y) {
        const auto* src = mat->ptr<std::uint8_t>(y);
        auto* dst = rgb.ptr<cv::Vec3b>(y);
        for (int x = 0; x < mat->cols; ++x) {
          const std::size_t idx = src[x] < palette.size() ? src[x] : 0;
          const auto& entry = palette[idx];
          dst[x] = cv::Vec3b(entry[0], entry[1], entry[2]);
        }
      }
      break;
    }
    case pc::PixelMode::RGB:
      rgb = mat->clone();
      break;
    case pc::PixelMode::RGBA:
      cv::cvtColor(*mat, rgb, cv::COLOR_RGBA2RGB);
      break;
  }
  return rgb;
}

cv::Mat alpha_plane(const pc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return cv::Mat();

  cv::Mat alpha;
  switch (image.mode()) {
    case pc::PixelMode::RGBA:
      cv::extractChannel(*mat, alpha, 3);
      break;
    case pc::PixelMode::GrayscaleAlpha:
      cv::extractChannel(*mat, alpha, 1);
      break;
    default:
      alpha = cv::Mat(mat->rows, mat->cols, CV_8UC1, cv::Scalar(255));
      break;
  }
  return alpha;
}

}  // namespace pictor::imaging::detail
