#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/image_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace pictor::core {

/// Callback for per-stage timing: (stage_index, stage_name, duration_ms). Optional; pass to run().
using StageTimingCallback =
    std::function<void(std::size_t stage_index, const char* stage_name, double duration_ms)>;

/// Runs a sequence of stages, feeding each stage the previous stage's output.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IImageStage> stage);

  /// Run all stages on `input`; returns the last stage's output or the first error.
  /// An empty pipeline returns the input unchanged.
  /// If timing_cb is non-null, it is called after each stage with
  /// (stage_index, stage_name, duration_ms).
  [[nodiscard]] std::expected<Image, ImageError> run(
      Image input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  /// Name of stage `index`; "" when out of range.
  [[nodiscard]] const char* stage_name(std::size_t index) const noexcept;

 private:
  std::vector<std::unique_ptr<IImageStage>> stages_;
};

}  // namespace pictor::core
