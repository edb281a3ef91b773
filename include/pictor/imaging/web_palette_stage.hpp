#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_stage.hpp>
#include <expected>
#include <vector>

namespace pictor::imaging {

/// 256-entry web-safe palette: the 6x6x6 color cube (levels 0, 51, ..., 255)
/// at indices r*36 + g*6 + b, remaining 40 entries black.
[[nodiscard]] const std::vector<pictor::core::PaletteEntry>& web_palette();

/// PNG size reduction: converts a non-palette image to the web palette with
/// Floyd-Steinberg dithering. An alpha channel is extracted first and put
/// back afterwards, which yields RGBA with palette colors; without alpha the
/// result is a Palette image. Palette input passes through.
class WebPaletteStage : public pictor::core::IImageStage {
 public:
  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  process(const pictor::core::Image& input) override;

  [[nodiscard]] const char* name() const noexcept override { return "web_palette"; }
};

}  // namespace pictor::imaging
