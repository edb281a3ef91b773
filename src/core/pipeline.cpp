#include <pictor/core/pipeline.hpp>
#include <chrono>

namespace pictor::core {

void Pipeline::add_stage(std::unique_ptr<IImageStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

const char* Pipeline::stage_name(std::size_t index) const noexcept {
  if (index >= stages_.size()) return "";
  return stages_[index]->name();
}

std::expected<Image, ImageError> Pipeline::run(
    Image input,
    StageTimingCallback* timing_cb) {
  Image current = std::move(input);

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(current);
    if (timing_cb && *timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, stages_[i]->name(), ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  return current;
}

}  // namespace pictor::core
