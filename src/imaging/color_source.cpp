#include <pictor/imaging/color_source.hpp>
#include <algorithm>

namespace pictor::imaging {

namespace {

constexpr int kStepCount = (kColorChannelMax - kColorChannelMin) / kColorChannelStep;

}  // namespace

UniformColorSource::UniformColorSource()
    : UniformColorSource(std::random_device{}()) {}

UniformColorSource::UniformColorSource(std::uint32_t seed)
    : engine_(seed), step_(0, kStepCount) {}

int UniformColorSource::next_channel_value() {
  std::lock_guard lock(mutex_);
  return kColorChannelMin + step_(engine_) * kColorChannelStep;
}

std::array<std::uint8_t, 3> next_background_color(IColorSource& source) {
  std::array<std::uint8_t, 3> color{};
  for (auto& c : color) {
    const int v = std::clamp(source.next_channel_value(), 0, 255);
    c = static_cast<std::uint8_t>(v);
  }
  return color;
}

}  // namespace pictor::imaging
