#include <pictor/core/image_format.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

namespace pictor::core {

namespace {

using namespace std::string_view_literals;

bool starts_with(std::span<const std::byte> bytes, std::string_view magic,
                 std::size_t offset = 0) {
  if (bytes.size() < offset + magic.size()) return false;
  return std::memcmp(bytes.data() + offset, magic.data(), magic.size()) == 0;
}

std::string to_upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

std::string_view format_name(ImageFormat format) noexcept {
  switch (format) {
    case ImageFormat::PNG:
      return "PNG";
    case ImageFormat::JPEG:
      return "JPEG";
    case ImageFormat::GIF:
      return "GIF";
    case ImageFormat::BMP:
      return "BMP";
    case ImageFormat::WEBP:
      return "WEBP";
    case ImageFormat::TIFF:
      return "TIFF";
    case ImageFormat::Other:
      return "";
  }
  return "";
}

ImageFormat detect_format(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, "\x89PNG\r\n\x1a\n"sv)) return ImageFormat::PNG;
  if (starts_with(bytes, "\xff\xd8\xff"sv)) return ImageFormat::JPEG;
  if (starts_with(bytes, "GIF87a"sv) || starts_with(bytes, "GIF89a"sv)) return ImageFormat::GIF;
  if (starts_with(bytes, "BM"sv)) return ImageFormat::BMP;
  if (starts_with(bytes, "RIFF"sv) && starts_with(bytes, "WEBP"sv, 8)) return ImageFormat::WEBP;
  if (starts_with(bytes, "II*\0"sv) || starts_with(bytes, "MM\0*"sv)) return ImageFormat::TIFF;
  return ImageFormat::Other;
}

ImageFormat resolve_output_format(std::string_view requested, ImageFormat intrinsic) {
  const std::string name =
      requested.empty() ? std::string(format_name(intrinsic)) : to_upper(requested);
  if (name == "PNG" || name == "BMP") return ImageFormat::PNG;
  if (name == "GIF") return ImageFormat::GIF;
  return ImageFormat::JPEG;
}

std::string_view sniff_mime_subtype(std::string_view base64_source) noexcept {
  if (base64_source.empty()) return "png";
  switch (base64_source.front()) {
    case '/':
      return "jpg";
    case 'R':
      return "gif";
    case 'i':
      return "png";
    case 'P':
      return "svg+xml";
    default:
      return "png";
  }
}

bool looks_like_svg(std::string_view base64_source) noexcept {
  return !base64_source.empty() && base64_source.front() == 'P';
}

std::string image_data_uri(std::string_view base64_source) {
  std::string uri = "data:image/";
  uri += sniff_mime_subtype(base64_source);
  uri += ";base64,";
  uri += base64_source;
  return uri;
}

}  // namespace pictor::core
