#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_stage.hpp>
#include <pictor/core/process_options.hpp>
#include <expected>

namespace pictor::imaging {

/// Shrinks the input to fit inside a bounding size, keeping its ratio.
/// Never enlarges. Lanczos resampling; palette and bilevel images use
/// nearest neighbour so indices stay meaningful.
class ThumbnailStage : public pictor::core::IImageStage {
 public:
  explicit ThumbnailStage(pictor::core::Size bounds);

  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  process(const pictor::core::Image& input) override;

  [[nodiscard]] const char* name() const noexcept override { return "thumbnail"; }

 private:
  pictor::core::Size bounds_;
};

}  // namespace pictor::imaging
