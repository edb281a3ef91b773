#pragma once

#include <pictor/core/process_options.hpp>
#include <cstdint>

namespace pictor::core {

/// Pixel rectangle: top-left corner plus extent.
struct CropWindow {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t width{0};
  std::uint32_t height{0};
  friend bool operator==(const CropWindow&, const CropWindow&) = default;
};

/// Fill a zero component of `requested` from the other one and the original
/// ratio (integer truncation). Components never go below 1.
/// Precondition: requested.any() and original dimensions non-zero.
[[nodiscard]] Size asked_size(std::uint32_t width, std::uint32_t height,
                              Size requested) noexcept;

/// Largest window of the asked ratio inside (width, height), placed
/// horizontally at the center and vertically according to `mode`.
/// At least one window dimension equals the original one.
[[nodiscard]] CropWindow crop_window(std::uint32_t width, std::uint32_t height,
                                     Size asked, CropMode mode) noexcept;

/// Size after shrinking (width, height) to fit inside `bounds` while keeping
/// the ratio. Never grows a dimension.
[[nodiscard]] Size thumbnail_size(std::uint32_t width, std::uint32_t height,
                                  Size bounds) noexcept;

}  // namespace pictor::core
