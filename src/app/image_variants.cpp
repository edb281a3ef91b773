#include <pictor/app/image_variants.hpp>
#include <pictor/core/image_format.hpp>
#include <array>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;
namespace pi = pictor::imaging;

namespace {

ImageResult run_with_size(const pi::ImageTransformer& transformer,
                          std::string_view source,
                          pc::Size size,
                          std::string_view format) {
  pc::ProcessOptions options;
  options.size = size;
  options.output_format = std::string(format);
  return transformer.process(source, options);
}

/// Non-empty value of `name` in `fields`, or nullptr.
const std::string* non_empty_field(const ImageFields& fields, const std::string& name) {
  if (name.empty()) return nullptr;
  auto it = fields.find(name);
  if (it == fields.end() || !it->second || it->second->empty()) return nullptr;
  return &*it->second;
}

}  // namespace

ImageResult resize_image(const pi::ImageTransformer& transformer,
                         std::string_view source,
                         pc::Size size,
                         std::string_view format) {
  return run_with_size(transformer, source, size, format);
}

ImageResult resize_image_big(const pi::ImageTransformer& transformer,
                             std::string_view source,
                             std::string_view format) {
  return run_with_size(transformer, source, pc::IMAGE_BIG_SIZE, format);
}

ImageResult resize_image_large(const pi::ImageTransformer& transformer,
                               std::string_view source,
                               std::string_view format) {
  return run_with_size(transformer, source, pc::IMAGE_LARGE_SIZE, format);
}

ImageResult resize_image_medium(const pi::ImageTransformer& transformer,
                                std::string_view source,
                                std::string_view format) {
  return run_with_size(transformer, source, pc::IMAGE_MEDIUM_SIZE, format);
}

ImageResult resize_image_small(const pi::ImageTransformer& transformer,
                               std::string_view source,
                               std::string_view format) {
  return run_with_size(transformer, source, pc::IMAGE_SMALL_SIZE, format);
}

ImageResult optimize_for_web(const pi::ImageTransformer& transformer,
                             std::string_view source,
                             std::uint32_t max_width,
                             int quality) {
  pc::ProcessOptions options;
  options.size = {max_width, 0};
  options.verify_resolution = true;
  options.quality = quality;
  return transformer.process(source, options);
}

ImageResult crop_image(const pi::ImageTransformer& transformer,
                       std::string_view source,
                       pc::Size size,
                       pc::CropMode crop,
                       std::string_view format) {
  pc::ProcessOptions options;
  options.size = size;
  options.crop = crop;
  options.output_format = std::string(format);
  return transformer.process(source, options);
}

ImageResult limited_image_resize(const pi::ImageTransformer& transformer,
                                 std::string_view source,
                                 std::uint32_t width,
                                 std::uint32_t height,
                                 pc::CropMode crop) {
  pc::ProcessOptions options;
  options.size = {width, height};
  options.crop = crop;
  return transformer.process(source, options);
}

ImageResult colorize_image(const pi::ImageTransformer& transformer,
                           std::string_view source) {
  pc::ProcessOptions options;
  options.colorize = true;
  return transformer.process(source, options);
}

std::expected<bool, pc::ImageError> is_image_size_above(const pi::ImageTransformer& transformer,
                                                        std::string_view source,
                                                        pc::Size size) {
  if (source.empty() || pc::looks_like_svg(source)) return false;
  auto image = transformer.decode(source);
  if (!image) {
    return std::unexpected(image.error());
  }
  return image->width() > size.width || image->height() > size.height;
}

pc::Size guess_size_from_field_name(std::string_view field_name) {
  std::string_view suffix = "big";
  if (field_name != "image") {
    const auto pos = field_name.rfind('_');
    suffix = pos == std::string_view::npos ? field_name : field_name.substr(pos + 1);
  }
  if (suffix == "big") return pc::IMAGE_BIG_SIZE;
  if (suffix == "large") return pc::IMAGE_LARGE_SIZE;
  if (suffix == "medium") return pc::IMAGE_MEDIUM_SIZE;
  if (suffix == "small") return pc::IMAGE_SMALL_SIZE;
  return pc::Size{0, 0};
}

std::expected<ImageFields, pc::ImageError> get_resized_images(const pi::ImageTransformer& transformer,
                                                              std::string_view source,
                                                              const VariantNames& names) {
  const std::array<std::pair<const std::string*, pc::Size>, 4> variants = {{
      {&names.big, pc::IMAGE_BIG_SIZE},
      {&names.large, pc::IMAGE_LARGE_SIZE},
      {&names.medium, pc::IMAGE_MEDIUM_SIZE},
      {&names.small, pc::IMAGE_SMALL_SIZE},
  }};

  ImageFields out;
  for (const auto& [name, size] : variants) {
    if (name->empty()) continue;
    auto result = run_with_size(transformer, source, size, {});
    if (!result) {
      return std::unexpected(result.error());
    }
    out[*name] = std::move(*result);
  }
  return out;
}

std::expected<void, pc::ImageError> resize_images(const pi::ImageTransformer& transformer,
                                                  ImageFields& fields,
                                                  const VariantSelection& selection,
                                                  const VariantNames& names) {
  const std::string* biggest = nullptr;
  for (const std::string* name : {&names.big, &names.large, &names.medium, &names.small}) {
    biggest = non_empty_field(fields, *name);
    if (biggest) break;
  }

  VariantNames selected;
  selected.big = selection.big ? names.big : std::string();
  selected.large = selection.large ? names.large : std::string();
  selected.medium = selection.medium ? names.medium : std::string();
  selected.small = selection.small ? names.small : std::string();

  if (biggest) {
    // Copy: `biggest` points into `fields`, which is about to be updated.
    const std::string source = *biggest;
    auto resized = get_resized_images(transformer, source, selected);
    if (!resized) {
      return std::unexpected(resized.error());
    }
    for (auto& [name, value] : *resized) {
      fields[name] = std::move(value);
    }
    return {};
  }

  bool any_present = false;
  for (const std::string* name : {&names.big, &names.large, &names.medium, &names.small}) {
    if (!name->empty() && fields.contains(*name)) any_present = true;
  }
  if (!any_present) return {};

  for (const std::string* name : {&selected.big, &selected.large, &selected.medium, &selected.small}) {
    if (!name->empty()) fields[*name] = std::nullopt;
  }
  return {};
}

}  // namespace pictor::app
