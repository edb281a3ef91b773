#include <pictor/core/image_header.hpp>
#include <pictor/core/image_format.hpp>
#include <cstdlib>

namespace pictor::core {

namespace {

std::uint32_t u8_at(std::span<const std::byte> b, std::size_t at) {
  return std::to_integer<std::uint32_t>(b[at]);
}

std::uint32_t be16(std::span<const std::byte> b, std::size_t at) {
  return (u8_at(b, at) << 8) | u8_at(b, at + 1);
}

std::uint32_t be32(std::span<const std::byte> b, std::size_t at) {
  return (be16(b, at) << 16) | be16(b, at + 2);
}

std::uint32_t le16(std::span<const std::byte> b, std::size_t at) {
  return u8_at(b, at) | (u8_at(b, at + 1) << 8);
}

std::uint32_t le24(std::span<const std::byte> b, std::size_t at) {
  return le16(b, at) | (u8_at(b, at + 2) << 16);
}

std::uint32_t le32(std::span<const std::byte> b, std::size_t at) {
  return le16(b, at) | (le16(b, at + 2) << 16);
}

bool has_tag(std::span<const std::byte> b, std::size_t at, const char (&tag)[5]) {
  if (b.size() < at + 4) return false;
  for (std::size_t i = 0; i < 4; ++i) {
    if (u8_at(b, at + i) != static_cast<unsigned char>(tag[i])) return false;
  }
  return true;
}

std::optional<ImageDimensions> non_empty(std::uint32_t w, std::uint32_t h) {
  if (w == 0 || h == 0) return std::nullopt;
  return ImageDimensions{w, h};
}

// Signature, IHDR length, "IHDR", then big-endian width and height.
std::optional<ImageDimensions> png_dimensions(std::span<const std::byte> b) {
  if (b.size() < 24 || !has_tag(b, 12, "IHDR")) return std::nullopt;
  return non_empty(be32(b, 16), be32(b, 20));
}

// Logical screen descriptor follows the 6 byte signature.
std::optional<ImageDimensions> gif_dimensions(std::span<const std::byte> b) {
  if (b.size() < 10) return std::nullopt;
  return non_empty(le16(b, 6), le16(b, 8));
}

// 14 byte file header, then the DIB header; a negative height is top-down.
std::optional<ImageDimensions> bmp_dimensions(std::span<const std::byte> b) {
  if (b.size() < 26) return std::nullopt;
  const std::uint32_t dib_size = le32(b, 14);
  if (dib_size == 12) {
    return non_empty(le16(b, 18), le16(b, 20));
  }
  if (dib_size < 40) return std::nullopt;
  const auto w = static_cast<std::int32_t>(le32(b, 18));
  const auto h = static_cast<std::int32_t>(le32(b, 22));
  if (w <= 0 || h == 0) return std::nullopt;
  return non_empty(static_cast<std::uint32_t>(w),
                   static_cast<std::uint32_t>(std::abs(static_cast<std::int64_t>(h))));
}

// Walk the marker segments up to the first start-of-frame.
std::optional<ImageDimensions> jpeg_dimensions(std::span<const std::byte> b) {
  std::size_t at = 2;
  while (at + 4 <= b.size()) {
    if (u8_at(b, at) != 0xFF) return std::nullopt;
    const std::uint32_t marker = u8_at(b, at + 1);
    if (marker == 0xFF) {  // fill byte
      ++at;
      continue;
    }
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) {  // no length
      at += 2;
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA) return std::nullopt;  // EOI / SOS before SOF
    const std::uint32_t length = be16(b, at + 2);
    const bool is_sof = marker >= 0xC0 && marker <= 0xCF &&
                        marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
    if (is_sof) {
      if (at + 9 > b.size()) return std::nullopt;
      return non_empty(be16(b, at + 7), be16(b, at + 5));
    }
    if (length < 2) return std::nullopt;
    at += 2 + length;
  }
  return std::nullopt;
}

// RIFF container; the first chunk is VP8X, VP8L or VP8.
std::optional<ImageDimensions> webp_dimensions(std::span<const std::byte> b) {
  if (has_tag(b, 12, "VP8X")) {
    if (b.size() < 30) return std::nullopt;
    return non_empty(le24(b, 24) + 1, le24(b, 27) + 1);
  }
  if (has_tag(b, 12, "VP8L")) {
    if (b.size() < 25 || u8_at(b, 20) != 0x2F) return std::nullopt;
    const std::uint32_t bits = le32(b, 21);
    return non_empty((bits & 0x3FFF) + 1, ((bits >> 14) & 0x3FFF) + 1);
  }
  if (has_tag(b, 12, "VP8 ")) {
    if (b.size() < 30) return std::nullopt;
    if (u8_at(b, 23) != 0x9D || u8_at(b, 24) != 0x01 || u8_at(b, 25) != 0x2A) {
      return std::nullopt;
    }
    return non_empty(le16(b, 26) & 0x3FFF, le16(b, 28) & 0x3FFF);
  }
  return std::nullopt;
}

}  // namespace

std::optional<ImageDimensions> header_dimensions(std::span<const std::byte> bytes) noexcept {
  switch (detect_format(bytes)) {
    case ImageFormat::PNG:
      return png_dimensions(bytes);
    case ImageFormat::GIF:
      return gif_dimensions(bytes);
    case ImageFormat::BMP:
      return bmp_dimensions(bytes);
    case ImageFormat::JPEG:
      return jpeg_dimensions(bytes);
    case ImageFormat::WEBP:
      return webp_dimensions(bytes);
    default:
      return std::nullopt;
  }
}

}  // namespace pictor::core
