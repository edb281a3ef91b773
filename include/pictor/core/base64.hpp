#pragma once

#include <pictor/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pictor::core {

/// Standard alphabet base64 with '=' padding.
[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);

/// Decode base64 text. ASCII whitespace (line breaks of MIME-wrapped
/// payloads) is skipped; anything else outside the alphabet, bad padding or a
/// truncated final quantum yields InvalidBase64.
[[nodiscard]] std::expected<std::vector<std::byte>, ImageError>
base64_decode(std::string_view text);

}  // namespace pictor::core
