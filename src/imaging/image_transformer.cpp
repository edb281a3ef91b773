#include <pictor/imaging/image_transformer.hpp>
#include <pictor/core/base64.hpp>
#include <pictor/core/geometry.hpp>
#include <pictor/core/image_format.hpp>
#include <pictor/core/image_header.hpp>
#include <pictor/imaging/colorize_stage.hpp>
#include <pictor/imaging/crop_stage.hpp>
#include <pictor/imaging/mode_convert_stage.hpp>
#include <pictor/imaging/opencv_codec.hpp>
#include <pictor/imaging/thumbnail_stage.hpp>
#include <pictor/imaging/web_palette_stage.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pictor::imaging {

namespace pc = pictor::core;

namespace {

constexpr int kMinJpegQuality = 1;
constexpr int kMaxJpegQuality = 95;

}  // namespace

ImageTransformer::ImageTransformer()
    : ImageTransformer(std::make_shared<OpenCvCodec>(),
                       std::make_shared<UniformColorSource>()) {}

ImageTransformer::ImageTransformer(std::shared_ptr<const ICodec> codec,
                                   std::shared_ptr<IColorSource> colors)
    : codec_(std::move(codec)), colors_(std::move(colors)) {
  if (!codec_ || !colors_) {
    throw std::invalid_argument("ImageTransformer requires a codec and a color source");
  }
}

std::expected<pc::Image, pc::ImageError>
ImageTransformer::decode(std::string_view source) const {
  auto bytes = pc::base64_decode(source);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return codec_->decode(*bytes);
}

pc::Pipeline ImageTransformer::build_pipeline(const pc::Image& image,
                                              const pc::ProcessOptions& options,
                                              pc::ImageFormat output_format) const {
  pc::Pipeline pipeline;

  if (options.size.any()) {
    const pc::Size asked = pc::asked_size(image.width(), image.height(), options.size);
    if (options.crop != pc::CropMode::None) {
      pipeline.add_stage(std::make_unique<CropStage>(asked, options.crop));
    }
    pipeline.add_stage(std::make_unique<ThumbnailStage>(asked));
  }

  if (options.colorize) {
    pipeline.add_stage(std::make_unique<ColorizeStage>(next_background_color(*colors_)));
  }

  if (output_format == pc::ImageFormat::PNG) {
    pipeline.add_stage(std::make_unique<WebPaletteStage>());
  }

  pipeline.add_stage(std::make_unique<ModeConvertStage>(output_format));
  return pipeline;
}

std::expected<pc::ProcessResult, pc::ImageError>
ImageTransformer::process(std::string_view source,
                          const pc::ProcessOptions& options,
                          pc::StageTimingCallback* timing_cb) const {
  if (source.empty()) {
    return pc::ProcessResult{};
  }
  // Vector content is never rasterized.
  if (pc::looks_like_svg(source)) {
    return pc::ProcessResult{std::string(source)};
  }
  auto bytes = pc::base64_decode(source);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }

  // Header dimensions let oversized uploads be refused before any pixel is decoded.
  if (options.verify_resolution) {
    const auto announced = pc::header_dimensions(*bytes);
    if (announced && announced->pixel_count() > pc::IMAGE_MAX_RESOLUTION) {
      return std::unexpected(pc::ImageError::ResolutionExceeded);
    }
  }

  auto image = codec_->decode(*bytes);
  if (!image) {
    return std::unexpected(image.error());
  }

  if (options.verify_resolution && image->pixel_count() > pc::IMAGE_MAX_RESOLUTION) {
    return std::unexpected(pc::ImageError::ResolutionExceeded);
  }

  // Must be resolved before any stage; stages keep the intrinsic format.
  const pc::ImageFormat output_format =
      pc::resolve_output_format(options.output_format, image->format());

  pc::Pipeline pipeline = build_pipeline(*image, options, output_format);
  auto transformed = pipeline.run(std::move(*image), timing_cb);
  if (!transformed) {
    return std::unexpected(transformed.error());
  }

  EncodeOptions encode_options;
  encode_options.optimize = true;
  // Only JPEG reads the quality; it is clamped to the encoder's useful range.
  encode_options.quality = output_format == pc::ImageFormat::JPEG
                               ? std::clamp(options.quality, kMinJpegQuality, kMaxJpegQuality)
                               : options.quality;

  auto encoded = codec_->encode(*transformed, output_format, encode_options);
  if (!encoded) {
    return std::unexpected(encoded.error());
  }
  return pc::ProcessResult{pc::base64_encode(*encoded)};
}

}  // namespace pictor::imaging
