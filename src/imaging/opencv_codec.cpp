#include <pictor/imaging/opencv_codec.hpp>
#include "image_cv_utils.hpp"
#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_format.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace pictor::imaging {

namespace pc = pictor::core;

namespace {

/// Bring any decoded depth down to 8 bit per channel.
cv::Mat to_8bit(const cv::Mat& mat) {
  if (mat.depth() == CV_8U) return mat;
  double scale = 1.0;
  switch (mat.depth()) {
    case CV_16U:
      scale = 1.0 / 257.0;
      break;
    case CV_32F:
    case CV_64F:
      scale = 255.0;
      break;
    default:
      break;
  }
  cv::Mat out;
  mat.convertTo(out, CV_MAKETYPE(CV_8U, mat.channels()), scale);
  return out;
}

/// Channel layout cv::imencode expects (BGR order) for a core::Image.
cv::Mat to_encoder_layout(const pc::Image& image) {
  auto mat = detail::image_to_mat(image);
  if (!mat) return cv::Mat();

  cv::Mat out;
  switch (image.mode()) {
    case pc::PixelMode::Bilevel:
    case pc::PixelMode::Grayscale:
      out = *mat;
      break;
    case pc::PixelMode::Palette:
      cv::cvtColor(detail::to_rgb(image), out, cv::COLOR_RGB2BGR);
      break;
    case pc::PixelMode::RGB:
      cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
      break;
    case pc::PixelMode::RGBA:
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2BGRA);
      break;
    case pc::PixelMode::GrayscaleAlpha: {
      std::vector<cv::Mat> planes;
      cv::split(*mat, planes);
      cv::merge(std::vector<cv::Mat>{planes[0], planes[0], planes[0], planes[1]}, out);
      break;
    }
  }
  return out;
}

}  // namespace

std::expected<pc::Image, pc::ImageError>
OpenCvCodec::decode(std::span<const std::byte> bytes) const {
  if (bytes.empty()) {
    return std::unexpected(pc::ImageError::DecodeFailed);
  }

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::ImageError::DecodeFailed);
  }
  if (mat.empty()) {
    return std::unexpected(pc::ImageError::DecodeFailed);
  }
  mat = to_8bit(mat);

  cv::Mat rgb;
  pc::PixelMode mode;
  switch (mat.channels()) {
    case 1:
      rgb = mat;
      mode = pc::PixelMode::Grayscale;
      break;
    case 2:
      rgb = mat;
      mode = pc::PixelMode::GrayscaleAlpha;
      break;
    case 3:
      cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
      mode = pc::PixelMode::RGB;
      break;
    case 4:
      cv::cvtColor(mat, rgb, cv::COLOR_BGRA2RGBA);
      mode = pc::PixelMode::RGBA;
      break;
    default:
      return std::unexpected(pc::ImageError::DecodeFailed);
  }

  const pc::Image like(0, 0, mode, pc::detect_format(bytes), {});
  return detail::mat_to_image(rgb, mode, like);
}

std::expected<std::vector<std::byte>, pc::ImageError>
OpenCvCodec::encode(const pc::Image& image,
                    pc::ImageFormat format,
                    const EncodeOptions& options) const {
  if (!image.valid()) {
    return std::unexpected(pc::ImageError::InvalidImage);
  }

  std::string ext;
  std::vector<int> params;
  switch (format) {
    case pc::ImageFormat::PNG:
      ext = ".png";
      if (options.optimize) {
        params = {cv::IMWRITE_PNG_COMPRESSION, 9};
      }
      break;
    case pc::ImageFormat::JPEG:
      ext = ".jpg";
      params = {cv::IMWRITE_JPEG_QUALITY, options.quality,
                cv::IMWRITE_JPEG_OPTIMIZE, options.optimize ? 1 : 0};
      break;
    case pc::ImageFormat::GIF:
      ext = ".gif";
      break;
    default:
      return std::unexpected(pc::ImageError::EncodeFailed);
  }

  cv::Mat mat = to_encoder_layout(image);
  if (mat.empty()) {
    return std::unexpected(pc::ImageError::InvalidImage);
  }
  // The GIF writer takes 3 or 4 channel input.
  if (format == pc::ImageFormat::GIF && mat.channels() == 1) {
    cv::cvtColor(mat, mat, cv::COLOR_GRAY2BGR);
  }

  std::vector<std::uint8_t> buf;
  try {
    if (!cv::imencode(ext, mat, buf, params)) {
      return std::unexpected(pc::ImageError::EncodeFailed);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(pc::ImageError::EncodeFailed);
  }

  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

}  // namespace pictor::imaging
