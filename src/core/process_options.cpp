#include <pictor/core/process_options.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace pictor::core {

CropMode parse_crop_mode(const std::string& value) {
  std::string v = value;
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (v.empty() || v == "none" || v == "false" || v == "0") return CropMode::None;
  if (v == "top") return CropMode::Top;
  if (v == "bottom") return CropMode::Bottom;
  return CropMode::Center;
}

}  // namespace pictor::core
