#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/image.hpp>
#include <pictor/core/pipeline.hpp>
#include <pictor/core/process_options.hpp>
#include <pictor/imaging/codec.hpp>
#include <pictor/imaging/color_source.hpp>
#include <expected>
#include <memory>
#include <string_view>

namespace pictor::imaging {

/// Decode -> resolution guard -> format resolution -> crop/thumbnail ->
/// colorize -> per-format preparation -> re-encode, on base64 payloads.
///
/// Each process() call is independent; the transformer only holds its
/// collaborators, so one instance may serve several threads as long as the
/// codec and color source are thread-safe (the defaults are).
class ImageTransformer {
 public:
  /// OpenCvCodec and a randomly seeded UniformColorSource.
  ImageTransformer();

  ImageTransformer(std::shared_ptr<const ICodec> codec,
                   std::shared_ptr<IColorSource> colors);

  /// Transform a base64 payload.
  /// - empty source: std::nullopt ("no image"), not an error;
  /// - SVG source (first character 'P'): returned unchanged;
  /// - InvalidBase64 / DecodeFailed for malformed input;
  /// - ResolutionExceeded when options.verify_resolution and the image has
  ///   more than IMAGE_MAX_RESOLUTION pixels.
  /// options.quality only applies to JPEG output and is clamped to [1, 95].
  /// If timing_cb is non-null it receives per-stage durations.
  [[nodiscard]] std::expected<pictor::core::ProcessResult, pictor::core::ImageError>
  process(std::string_view source,
          const pictor::core::ProcessOptions& options,
          pictor::core::StageTimingCallback* timing_cb = nullptr) const;

  /// Base64-decode and decode a raster payload.
  [[nodiscard]] std::expected<pictor::core::Image, pictor::core::ImageError>
  decode(std::string_view source) const;

  /// Stages process() runs for an image already decoded, in order.
  [[nodiscard]] pictor::core::Pipeline build_pipeline(
      const pictor::core::Image& image,
      const pictor::core::ProcessOptions& options,
      pictor::core::ImageFormat output_format) const;

 private:
  std::shared_ptr<const ICodec> codec_;
  std::shared_ptr<IColorSource> colors_;
};

}  // namespace pictor::imaging
