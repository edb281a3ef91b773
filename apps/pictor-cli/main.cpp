/**
 * pictor-cli — Resize / crop / recolor an image file and write the result.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/pictor_cli --input in.png --output out.png [--size 128x100]
 * With --data-uri: prints a data URI of the result instead of (or besides) writing a file.
 * Batch: repeat --input and pass --output-dir; files run on `workers` threads.
 */

#include <pictor/app/batch_runner.hpp>
#include <pictor/app/config.hpp>
#include <pictor/core/base64.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/image_format.hpp>
#include <pictor/core/process_options.hpp>
#include <pictor/imaging/image_transformer.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::byte> read_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("cannot open " + path);
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  std::vector<std::byte> bytes(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) bytes[i] = static_cast<std::byte>(raw[i]);
  return bytes;
}

void write_file(const std::string& path, const std::vector<std::byte>& bytes) {
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("cannot write " + path);
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

/// "WxH", "W" or "Wx" / "xH" (missing side = derived).
pictor::core::Size parse_size(const std::string& text) {
  const auto pos = text.find('x');
  const std::string w = text.substr(0, pos);
  const std::string h = pos == std::string::npos ? std::string() : text.substr(pos + 1);
  pictor::core::Size size;
  size.width = w.empty() ? 0 : static_cast<std::uint32_t>(std::stoul(w));
  size.height = h.empty() ? 0 : static_cast<std::uint32_t>(std::stoul(h));
  return size;
}

/// File extension for an encoded result, from its leading bytes.
std::string extension_for(const std::vector<std::byte>& bytes) {
  switch (pictor::core::detect_format(bytes)) {
    case pictor::core::ImageFormat::PNG: return ".png";
    case pictor::core::ImageFormat::GIF: return ".gif";
    default: return ".jpg";
  }
}

void print_usage() {
  std::cout << "Usage: pictor_cli --input <path> [--output <path>] [options]\n"
            << "       pictor_cli --input <path> --input <path> ... --output-dir <dir> [options]\n"
            << "  --config <path>       Defaults (key=value file); default: built-in\n"
            << "  --output-dir <dir>    Batch output; each file is written as <dir>/<stem>.<ext>\n"
            << "  --workers <n>         Batch worker threads; 0 = hardware concurrency\n"
            << "  --size <WxH>          Target size; 0 or missing side is derived (default 128x100)\n"
            << "  --crop <mode>         center | top | bottom (keeps the target ratio)\n"
            << "  --quality <n>         JPEG quality, clamped to 1-95 (default 80)\n"
            << "  --format <fmt>        PNG | JPEG | GIF (default: source format)\n"
            << "  --colorize            Replace transparency by a random background color\n"
            << "  --verify-resolution   Reject images above 45 million pixels\n"
            << "  --data-uri            Print the result as a data URI\n"
            << "  --timing              Print per-stage timings\n";
}

/// Writes every result to `dir`; returns the process exit code.
int run_batch(const pictor::imaging::ImageTransformer& transformer,
              const std::vector<std::string>& paths, const std::vector<std::string>& sources,
              const pictor::core::ProcessOptions& options, std::size_t workers,
              const std::string& dir) {
  std::mutex out_mutex;
  std::size_t failed = 0;
  pictor::app::run_process_batch_parallel(
      transformer, sources, options,
      [&](std::size_t index, const pictor::app::ImageResult& result) {
        const std::string& path = paths[index];
        if (!result || !result->has_value()) {
          const std::lock_guard<std::mutex> lock(out_mutex);
          ++failed;
          if (!result) {
            std::cerr << path << ": " << pictor::core::error_name(result.error()) << ": "
                      << pictor::core::error_message(result.error()) << "\n";
          } else {
            std::cerr << path << ": no image\n";
          }
          return;
        }
        auto bytes = pictor::core::base64_decode(**result);
        if (!bytes) {
          const std::lock_guard<std::mutex> lock(out_mutex);
          ++failed;
          std::cerr << path << ": result is not valid base64\n";
          return;
        }
        const std::string target =
            (std::filesystem::path(dir) / std::filesystem::path(path).stem()).string() +
            extension_for(*bytes);
        try {
          write_file(target, *bytes);
        } catch (const std::exception& e) {
          const std::lock_guard<std::mutex> lock(out_mutex);
          ++failed;
          std::cerr << path << ": " << e.what() << "\n";
          return;
        }
        const std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << "wrote " << target << " (" << bytes->size() << " bytes)\n";
      },
      workers);
  if (failed > 0) {
    std::cerr << failed << " of " << sources.size() << " files failed\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string output_path;
  std::string output_dir;
  std::string workers_override;
  std::string size_override;
  std::string crop_override;
  std::string quality_override;
  std::string format_override;
  bool colorize = false;
  bool verify_resolution = false;
  bool data_uri = false;
  bool timing = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--size" && i + 1 < argc) {
      size_override = argv[++i];
    } else if (arg == "--crop" && i + 1 < argc) {
      crop_override = argv[++i];
    } else if (arg == "--quality" && i + 1 < argc) {
      quality_override = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      format_override = argv[++i];
    } else if (arg == "--colorize") {
      colorize = true;
    } else if (arg == "--verify-resolution") {
      verify_resolution = true;
    } else if (arg == "--data-uri") {
      data_uri = true;
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  const bool batch = input_paths.size() > 1 || !output_dir.empty();
  if (input_paths.empty() || (batch && output_dir.empty()) ||
      (!batch && output_path.empty() && !data_uri)) {
    print_usage();
    return 1;
  }

  pictor::core::ProcessOptions options;
  std::size_t workers = 0;
  try {
    pictor::app::TransformConfig cfg = config_path.empty() ? pictor::app::default_config()
                                                           : pictor::app::load_config(config_path);
    if (!size_override.empty()) cfg.size = parse_size(size_override);
    if (!crop_override.empty()) cfg.crop = pictor::core::parse_crop_mode(crop_override);
    if (!quality_override.empty()) cfg.quality = std::stoi(quality_override);
    if (!format_override.empty()) cfg.output_format = format_override;
    if (colorize) cfg.colorize = true;
    if (verify_resolution) cfg.verify_resolution = true;
    if (!workers_override.empty()) cfg.workers = static_cast<std::size_t>(std::stoul(workers_override));
    options = pictor::app::to_process_options(cfg);
    workers = cfg.workers;
  } catch (const std::logic_error& e) {
    // std::stoi / std::stoul on a malformed value
    std::cerr << "Invalid configuration ("
              << pictor::core::error_name(pictor::core::ImageError::InvalidConfig)
              << "): " << e.what() << "\n";
    return 1;
  }

  std::vector<std::string> sources;
  try {
    for (const auto& path : input_paths) {
      sources.push_back(pictor::core::base64_encode(read_file(path)));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  const pictor::imaging::ImageTransformer transformer;
  if (batch) {
    return run_batch(transformer, input_paths, sources, options, workers, output_dir);
  }

  const std::string& source = sources.front();
  pictor::core::StageTimingCallback on_stage = [](std::size_t index, const char* name, double ms) {
    std::cout << "  stage " << index << " (" << name << "): " << ms << " ms\n";
  };
  auto result = pictor::app::run_process(transformer, source, options, timing ? &on_stage : nullptr);

  if (!result) {
    std::cerr << "Processing failed (" << pictor::core::error_name(result.error())
              << "): " << pictor::core::error_message(result.error()) << "\n";
    return 1;
  }
  if (!result->has_value()) {
    std::cerr << "Input is empty: no image\n";
    return 1;
  }

  const std::string& encoded = **result;
  if (data_uri) {
    std::cout << pictor::core::image_data_uri(encoded) << "\n";
  }
  if (!output_path.empty()) {
    auto bytes = pictor::core::base64_decode(encoded);
    if (!bytes) {
      std::cerr << "Internal error: result is not valid base64\n";
      return 1;
    }
    try {
      write_file(output_path, *bytes);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
    std::cout << "wrote " << output_path << " (" << bytes->size() << " bytes)\n";
  }
  return 0;
}
