#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pictor::core {

/// Arbitrary limit fitting most camera resolutions (8K up to 16:10 included).
inline constexpr std::uint64_t IMAGE_MAX_RESOLUTION = 45'000'000;

/// Target size; a zero component is derived from the other one and the
/// original aspect ratio. (0, 0) means "no resize".
struct Size {
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] bool any() const noexcept { return width != 0 || height != 0; }
  friend bool operator==(const Size&, const Size&) = default;
};

inline constexpr Size IMAGE_BIG_SIZE{1024, 1024};
inline constexpr Size IMAGE_LARGE_SIZE{256, 256};
inline constexpr Size IMAGE_MEDIUM_SIZE{128, 128};
inline constexpr Size IMAGE_SMALL_SIZE{64, 64};

/// Where to keep the image when cropping to the target ratio.
enum class CropMode : std::uint8_t {
  None,
  Center,
  Top,
  Bottom,
};

/// Parse "center" | "top" | "bottom" | "none" (empty = none).
/// Any other non-empty value crops at the center.
[[nodiscard]] CropMode parse_crop_mode(const std::string& value);

/// Options of a single ImageTransformer::process call.
struct ProcessOptions {
  Size size{};
  bool verify_resolution{false};
  int quality{80};  // JPEG only; 1 worst, 95 best
  CropMode crop{CropMode::None};
  bool colorize{false};
  std::string output_format;  // empty = keep the intrinsic format
};

/// Encoded image payload (base64 text).
using EncodedImage = std::string;

/// Result of a transformation; std::nullopt is the "no image" sentinel.
using ProcessResult = std::optional<EncodedImage>;

}  // namespace pictor::core
