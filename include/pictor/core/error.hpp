#pragma once

#include <string>

namespace pictor::core {

/// Transformation error codes; used with std::expected for recoverable failures.
enum class ImageError {
  None = 0,
  InvalidBase64,       // payload is not valid base64
  DecodeFailed,        // bytes are not a recognizable raster image
  ResolutionExceeded,  // pixel count above IMAGE_MAX_RESOLUTION
  InvalidImage,
  EncodeFailed,
  InvalidConfig,
};

/// True for both flavours of malformed input (bad base64, undecodable bytes).
[[nodiscard]] constexpr bool is_decode_error(ImageError e) noexcept {
  return e == ImageError::InvalidBase64 || e == ImageError::DecodeFailed;
}

/// Short name of the error code ("DecodeFailed", ...).
[[nodiscard]] const char* error_name(ImageError e) noexcept;

/// Human readable message, suitable for showing to the uploader.
[[nodiscard]] std::string error_message(ImageError e);

}  // namespace pictor::core
