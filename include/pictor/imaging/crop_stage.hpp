#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_stage.hpp>
#include <pictor/core/process_options.hpp>
#include <expected>

namespace pictor::imaging {

/// Crops the input to the ratio of the asked size, keeping as much of the
/// image as possible (see core::crop_window). The following ThumbnailStage
/// brings the window to the asked pixel size.
class CropStage : public pictor::core::IImageStage {
 public:
  CropStage(pictor::core::Size asked, pictor::core::CropMode mode);

  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  process(const pictor::core::Image& input) override;

  [[nodiscard]] const char* name() const noexcept override { return "crop"; }

 private:
  pictor::core::Size asked_;
  pictor::core::CropMode mode_;
};

}  // namespace pictor::imaging
