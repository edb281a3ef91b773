#pragma once

#include <pictor/core/process_options.hpp>
#include <cstddef>
#include <string>

namespace pictor::app {

/// Transformation defaults for the CLI and batch runners.
struct TransformConfig {
  pictor::core::Size size{128, 100};
  int quality{80};
  pictor::core::CropMode crop{pictor::core::CropMode::None};
  bool colorize{false};
  bool verify_resolution{false};
  std::string output_format;  // empty = keep source format
  std::size_t workers{0};     // 0 = hardware concurrency
};

/// Load config from a simple key=value file (one per line) or use defaults.
TransformConfig load_config(const std::string& path);

/// Default config when no file is provided.
TransformConfig default_config();

/// Options for ImageTransformer::process taken from the config.
[[nodiscard]] pictor::core::ProcessOptions to_process_options(const TransformConfig& config);

}  // namespace pictor::app
