#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/process_options.hpp>
#include <pictor/imaging/image_transformer.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pictor::app {

using ImageResult = std::expected<pictor::core::ProcessResult, pictor::core::ImageError>;

/// Resize to fit `size` (default BIG), optionally converting to `format`.
[[nodiscard]] ImageResult resize_image(const pictor::imaging::ImageTransformer& transformer,
                                       std::string_view source,
                                       pictor::core::Size size = pictor::core::IMAGE_BIG_SIZE,
                                       std::string_view format = {});

[[nodiscard]] ImageResult resize_image_big(const pictor::imaging::ImageTransformer& transformer,
                                           std::string_view source,
                                           std::string_view format = {});
[[nodiscard]] ImageResult resize_image_large(const pictor::imaging::ImageTransformer& transformer,
                                             std::string_view source,
                                             std::string_view format = {});
[[nodiscard]] ImageResult resize_image_medium(const pictor::imaging::ImageTransformer& transformer,
                                              std::string_view source,
                                              std::string_view format = {});
[[nodiscard]] ImageResult resize_image_small(const pictor::imaging::ImageTransformer& transformer,
                                             std::string_view source,
                                             std::string_view format = {});

/// Web upload path: width-limited resize with the resolution guard on.
[[nodiscard]] ImageResult optimize_for_web(const pictor::imaging::ImageTransformer& transformer,
                                           std::string_view source,
                                           std::uint32_t max_width = 0,
                                           int quality = 80);

[[nodiscard]] ImageResult crop_image(const pictor::imaging::ImageTransformer& transformer,
                                     std::string_view source,
                                     pictor::core::Size size,
                                     pictor::core::CropMode crop = pictor::core::CropMode::Center,
                                     std::string_view format = {});

[[nodiscard]] ImageResult limited_image_resize(const pictor::imaging::ImageTransformer& transformer,
                                               std::string_view source,
                                               std::uint32_t width,
                                               std::uint32_t height,
                                               pictor::core::CropMode crop = pictor::core::CropMode::None);

/// Replace the transparent background by a random color.
[[nodiscard]] ImageResult colorize_image(const pictor::imaging::ImageTransformer& transformer,
                                         std::string_view source);

/// Whether the decoded image is wider or taller than `size`.
/// False for an empty or SVG source.
[[nodiscard]] std::expected<bool, pictor::core::ImageError> is_image_size_above(
    const pictor::imaging::ImageTransformer& transformer,
    std::string_view source,
    pictor::core::Size size = pictor::core::IMAGE_BIG_SIZE);

/// Size preset from a field name: "image" or suffix "big" -> BIG, "large",
/// "medium", "small" likewise; anything else -> (0, 0).
[[nodiscard]] pictor::core::Size guess_size_from_field_name(std::string_view field_name);

/// Field names of the four variants; an empty name leaves that variant out.
struct VariantNames {
  std::string big{"image"};
  std::string large{"image_large"};
  std::string medium{"image_medium"};
  std::string small{"image_small"};
};

/// Which variants resize_images writes back.
struct VariantSelection {
  bool big{true};
  bool large{false};
  bool medium{true};
  bool small{true};
};

/// Record values keyed by field name; std::nullopt is an explicitly empty image.
using ImageFields = std::unordered_map<std::string, std::optional<std::string>>;

/// All variants of `source` whose name is non-empty.
[[nodiscard]] std::expected<ImageFields, pictor::core::ImageError> get_resized_images(
    const pictor::imaging::ImageTransformer& transformer,
    std::string_view source,
    const VariantNames& names = {});

/// Update `fields` with the selected variants, derived from the biggest
/// non-empty one present (big, then large, medium, small). When the fields
/// are present but all empty, the selected ones are set to std::nullopt.
/// When none is present, `fields` is left untouched. On error `fields` is
/// not modified.
[[nodiscard]] std::expected<void, pictor::core::ImageError> resize_images(
    const pictor::imaging::ImageTransformer& transformer,
    ImageFields& fields,
    const VariantSelection& selection = {},
    const VariantNames& names = {});

}  // namespace pictor::app
