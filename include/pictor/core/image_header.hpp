#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace pictor::core {

/// Pixel dimensions announced by an encoded image's header.
struct ImageDimensions {
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] std::uint64_t pixel_count() const noexcept {
    return static_cast<std::uint64_t>(width) * height;
  }
};

/// Read width and height from the header of a PNG, JPEG, GIF, BMP or WEBP
/// payload without decoding any pixel data.
/// std::nullopt for other formats and for truncated or malformed headers.
[[nodiscard]] std::optional<ImageDimensions> header_dimensions(
    std::span<const std::byte> bytes) noexcept;

}  // namespace pictor::core
