#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <expected>

namespace pictor::core {

/// Abstract transformation stage: take one Image, return the transformed Image.
class IImageStage {
 public:
  virtual ~IImageStage() = default;

  [[nodiscard]] virtual std::expected<Image, ImageError> process(
      const Image& input) = 0;

  /// Stage name for timing reports.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

}  // namespace pictor::core
