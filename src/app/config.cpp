#include <pictor/app/config.hpp>
#include <fstream>
#include <string_view>

namespace pictor::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

TransformConfig default_config() {
  TransformConfig c;
  c.size = {128, 100};
  c.quality = 80;
  c.crop = pictor::core::CropMode::None;
  c.colorize = false;
  c.verify_resolution = false;
  c.output_format = "";
  c.workers = 0;
  return c;
}

TransformConfig load_config(const std::string& path) {
  TransformConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "size_width") c.size.width = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "size_height") c.size.height = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "quality") c.quality = std::stoi(value);
    else if (key == "crop") c.crop = pictor::core::parse_crop_mode(value);
    else if (key == "colorize") c.colorize = parse_bool(value);
    else if (key == "verify_resolution") c.verify_resolution = parse_bool(value);
    else if (key == "output_format") c.output_format = value;
    else if (key == "workers") c.workers = static_cast<std::size_t>(std::stoul(value));
  }
  return c;
}

pictor::core::ProcessOptions to_process_options(const TransformConfig& config) {
  pictor::core::ProcessOptions o;
  o.size = config.size;
  o.quality = config.quality;
  o.crop = config.crop;
  o.colorize = config.colorize;
  o.verify_resolution = config.verify_resolution;
  o.output_format = config.output_format;
  return o;
}

}  // namespace pictor::app
