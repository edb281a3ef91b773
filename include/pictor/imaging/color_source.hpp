#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace pictor::imaging {

/// Background channel values are drawn from {32, 56, ..., 224}.
inline constexpr int kColorChannelMin = 32;
inline constexpr int kColorChannelMax = 224;
inline constexpr int kColorChannelStep = 24;

/// Source of background channel values for colorize.
class IColorSource {
 public:
  virtual ~IColorSource() = default;

  /// One channel value in {32, 56, ..., 224}.
  [[nodiscard]] virtual int next_channel_value() = 0;
};

/// Uniform draw over the 9 allowed channel values. Thread-safe.
class UniformColorSource : public IColorSource {
 public:
  UniformColorSource();
  explicit UniformColorSource(std::uint32_t seed);

  [[nodiscard]] int next_channel_value() override;

 private:
  std::mutex mutex_;
  std::mt19937 engine_;
  std::uniform_int_distribution<int> step_;
};

/// Draw an (r, g, b) background color, one channel at a time.
[[nodiscard]] std::array<std::uint8_t, 3> next_background_color(IColorSource& source);

}  // namespace pictor::imaging
