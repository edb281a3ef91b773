#pragma once

#include <pictor/imaging/codec.hpp>

namespace pictor::imaging {

/// Codec backed by cv::imdecode / cv::imencode. Stateless.
/// Decoded pixels are converted to 8 bit, RGB channel order.
class OpenCvCodec : public ICodec {
 public:
  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  decode(std::span<const std::byte> bytes) const override;

  [[nodiscard]] std::expected<std::vector<std::byte>, pictor::core::ImageError>
  encode(const pictor::core::Image& image,
         pictor::core::ImageFormat format,
         const EncodeOptions& options) const override;
};

}  // namespace pictor::imaging
