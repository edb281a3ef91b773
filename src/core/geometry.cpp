#include <pictor/core/geometry.hpp>
#include <algorithm>
#include <cstdint>

namespace pictor::core {

namespace {

using u64 = std::uint64_t;

std::uint32_t at_least_one(u64 v) {
  return static_cast<std::uint32_t>(std::max<u64>(v, 1));
}

}  // namespace

Size asked_size(std::uint32_t width, std::uint32_t height, Size requested) noexcept {
  const u64 w = width;
  const u64 h = height;
  Size asked;
  asked.width = requested.width != 0
                    ? requested.width
                    : at_least_one((w * requested.height) / h);
  asked.height = requested.height != 0
                     ? requested.height
                     : at_least_one((h * requested.width) / w);
  return asked;
}

CropWindow crop_window(std::uint32_t width, std::uint32_t height,
                       Size asked, CropMode mode) noexcept {
  const u64 w = width;
  const u64 h = height;
  const u64 aw = std::max<std::uint32_t>(asked.width, 1);
  const u64 ah = std::max<std::uint32_t>(asked.height, 1);

  // w / aw > h / ah, compared without division.
  u64 new_w;
  u64 new_h;
  if (w * ah > h * aw) {
    new_w = w;
    new_h = (ah * w) / aw;
  } else {
    new_w = (aw * h) / ah;
    new_h = h;
  }

  // No cropping above image size.
  if (new_w > w) {
    new_h = (new_h * w) / new_w;
    new_w = w;
  }
  if (new_h > h) {
    new_w = (new_w * h) / new_h;
    new_h = h;
  }
  new_w = std::max<u64>(new_w, 1);
  new_h = std::max<u64>(new_h, 1);

  // x is always centered; y follows the anchor (0, 0.5 or 1).
  CropWindow window;
  window.width = static_cast<std::uint32_t>(new_w);
  window.height = static_cast<std::uint32_t>(new_h);
  window.x = static_cast<std::uint32_t>((w - new_w) / 2);
  switch (mode) {
    case CropMode::Top:
      window.y = 0;
      break;
    case CropMode::Bottom:
      window.y = static_cast<std::uint32_t>(h - new_h);
      break;
    case CropMode::Center:
    case CropMode::None:
    default:
      window.y = static_cast<std::uint32_t>((h - new_h) / 2);
      break;
  }
  return window;
}

Size thumbnail_size(std::uint32_t width, std::uint32_t height, Size bounds) noexcept {
  u64 x = width;
  u64 y = height;
  const u64 bw = std::max<std::uint32_t>(bounds.width, 1);
  const u64 bh = std::max<std::uint32_t>(bounds.height, 1);
  if (x > bw) {
    y = std::max<u64>((y * bw) / x, 1);
    x = bw;
  }
  if (y > bh) {
    x = std::max<u64>((x * bh) / y, 1);
    y = bh;
  }
  return Size{static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y)};
}

}  // namespace pictor::core
