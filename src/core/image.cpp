#include <pictor/core/image.hpp>
#include <cstddef>

namespace pictor::core {

std::size_t Image::channels(PixelMode mode) noexcept {
  switch (mode) {
    case PixelMode::Bilevel:
    case PixelMode::Grayscale:
    case PixelMode::Palette:
      return 1;
    case PixelMode::GrayscaleAlpha:
      return 2;
    case PixelMode::RGB:
      return 3;
    case PixelMode::RGBA:
      return 4;
  }
  return 0;
}

std::size_t Image::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelMode mode) {
  return static_cast<std::size_t>(width) * height * channels(mode);
}

bool Image::valid() const noexcept {
  if (width_ == 0 || height_ == 0) return false;
  if (buffer_.size() < min_bytes(width_, height_, mode_)) return false;
  return mode_ != PixelMode::Palette || !palette_.empty();
}

}  // namespace pictor::core
