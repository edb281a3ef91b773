#pragma once

#include <pictor/core/image_format.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pictor::core {

/// Memory: Image owns its pixel buffer (and palette, if any); move semantics
/// and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Image instances are independent; sharing one Image
/// across threads requires external synchronization.

/// Channel layout of the pixel buffer. Color channels are stored in RGB order.
enum class PixelMode : std::uint8_t {
  Bilevel,         // 1 byte per pixel, 0 or 255
  Grayscale,
  Palette,         // 1 index byte per pixel into palette()
  RGB,
  RGBA,
  GrayscaleAlpha,
};

/// Palette entry (r, g, b).
using PaletteEntry = std::array<std::uint8_t, 3>;

/// Decoded raster: dimensions, pixel mode, intrinsic format and owned pixels.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelMode mode,
        ImageFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        mode_(mode),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelMode mode() const noexcept { return mode_; }
  /// Format detected at decode time; survives every transformation.
  [[nodiscard]] ImageFormat format() const noexcept { return format_; }

  [[nodiscard]] std::uint64_t pixel_count() const noexcept {
    return static_cast<std::uint64_t>(width_) * height_;
  }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Palette of a Palette-mode image; empty for every other mode.
  [[nodiscard]] const std::vector<PaletteEntry>& palette() const noexcept {
    return palette_;
  }
  void set_palette(std::vector<PaletteEntry> palette) { palette_ = std::move(palette); }

  /// True when the mode carries an alpha channel.
  [[nodiscard]] bool has_alpha() const noexcept {
    return mode_ == PixelMode::RGBA || mode_ == PixelMode::GrayscaleAlpha;
  }

  /// Bytes per pixel of a mode.
  [[nodiscard]] static std::size_t channels(PixelMode mode) noexcept;

  /// Minimum bytes required for given dimensions and mode (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelMode mode);

  /// Dimensions non-zero and buffer large enough for the mode.
  [[nodiscard]] bool valid() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelMode mode_{PixelMode::RGB};
  ImageFormat format_{ImageFormat::Other};
  std::vector<std::byte> buffer_;
  std::vector<PaletteEntry> palette_;
};

}  // namespace pictor::core
