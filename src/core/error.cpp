#include <pictor/core/error.hpp>
#include <pictor/core/process_options.hpp>
#include <sstream>

namespace pictor::core {

namespace {

/// Limit as shown to the uploader, in "millions" of pixels. The divisor is
/// 10e6 (1e7), so 45e6 is displayed as 4.5.
std::string resolution_limit_display() {
  std::ostringstream out;
  out << static_cast<double>(IMAGE_MAX_RESOLUTION) / 10e6;
  return out.str();
}

}  // namespace

const char* error_name(ImageError e) noexcept {
  switch (e) {
    case ImageError::None:
      return "None";
    case ImageError::InvalidBase64:
      return "InvalidBase64";
    case ImageError::DecodeFailed:
      return "DecodeFailed";
    case ImageError::ResolutionExceeded:
      return "ResolutionExceeded";
    case ImageError::InvalidImage:
      return "InvalidImage";
    case ImageError::EncodeFailed:
      return "EncodeFailed";
    case ImageError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

std::string error_message(ImageError e) {
  switch (e) {
    case ImageError::None:
      return "";
    case ImageError::InvalidBase64:
      return "Image payload is not valid base64.";
    case ImageError::DecodeFailed:
      return "This file could not be decoded as an image file.";
    case ImageError::ResolutionExceeded:
      return "Image size excessive, uploaded images must be smaller than " +
             resolution_limit_display() + " million pixels.";
    case ImageError::InvalidImage:
      return "Image data is inconsistent with its dimensions.";
    case ImageError::EncodeFailed:
      return "The image could not be encoded to the requested format.";
    case ImageError::InvalidConfig:
      return "Invalid configuration.";
  }
  return "Unknown error.";
}

}  // namespace pictor::core
