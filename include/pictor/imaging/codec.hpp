#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_format.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace pictor::imaging {

/// Encoder knobs resolved per output format by the transformer.
struct EncodeOptions {
  bool optimize{false};
  int quality{80};  // JPEG only
};

/// Abstract raster codec: raw bytes <-> core::Image.
/// Implementations must be usable from several threads at once
/// (independent calls share no mutable state).
class ICodec {
 public:
  virtual ~ICodec() = default;

  /// Decode any supported raster container. DecodeFailed if the bytes are
  /// not a recognizable image.
  [[nodiscard]] virtual std::expected<pictor::core::Image, pictor::core::ImageError>
  decode(std::span<const std::byte> bytes) const = 0;

  /// Encode to PNG, JPEG or GIF. EncodeFailed for any other format or
  /// an encoder failure.
  [[nodiscard]] virtual std::expected<std::vector<std::byte>, pictor::core::ImageError>
  encode(const pictor::core::Image& image,
         pictor::core::ImageFormat format,
         const EncodeOptions& options) const = 0;
};

}  // namespace pictor::imaging
