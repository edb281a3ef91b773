#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pictor::core {

/// Raster container formats known to the transformer.
enum class ImageFormat : std::uint8_t {
  PNG,
  JPEG,
  GIF,
  BMP,
  WEBP,
  TIFF,
  Other,
};

/// Upper-case format name ("PNG", "JPEG", ...). Other -> "".
[[nodiscard]] std::string_view format_name(ImageFormat format) noexcept;

/// Detect the container format from the leading bytes of a raw (decoded) payload.
[[nodiscard]] ImageFormat detect_format(std::span<const std::byte> bytes) noexcept;

/// Pick the output format: requested name if non-empty, else the intrinsic
/// format. BMP becomes PNG; anything but PNG, JPEG or GIF becomes JPEG.
/// The requested name is compared case-insensitively.
[[nodiscard]] ImageFormat resolve_output_format(std::string_view requested,
                                                ImageFormat intrinsic);

/// Mime subtype guessed from the first base64 character:
/// '/' jpg, 'R' gif, 'i' png, 'P' svg+xml; "png" when unknown or empty.
[[nodiscard]] std::string_view sniff_mime_subtype(std::string_view base64_source) noexcept;

/// First base64 character says SVG ('P', i.e. "<" or "<?xml" once decoded).
[[nodiscard]] bool looks_like_svg(std::string_view base64_source) noexcept;

/// RFC 2397 data URI: "data:image/<subtype>;base64,<payload>".
[[nodiscard]] std::string image_data_uri(std::string_view base64_source);

}  // namespace pictor::core
