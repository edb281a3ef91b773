#include <pictor/core/base64.hpp>
#include <array>
#include <cstdint>

namespace pictor::core {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::int8_t kInvalid = -1;
constexpr std::int8_t kSkip = -2;
constexpr std::int8_t kPad = -3;

constexpr std::array<std::int8_t, 256> make_reverse_table() {
  std::array<std::int8_t, 256> table{};
  for (auto& v : table) v = kInvalid;
  for (int i = 0; i < 64; ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
  }
  table[static_cast<unsigned char>(' ')] = kSkip;
  table[static_cast<unsigned char>('\t')] = kSkip;
  table[static_cast<unsigned char>('\r')] = kSkip;
  table[static_cast<unsigned char>('\n')] = kSkip;
  table[static_cast<unsigned char>('=')] = kPad;
  return table;
}

constexpr std::array<std::int8_t, 256> kReverse = make_reverse_table();

}  // namespace

std::string base64_encode(std::span<const std::byte> data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    const auto n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                   (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                   std::to_integer<std::uint32_t>(data[i + 2]);
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    out.push_back(kAlphabet[n & 0x3f]);
  }

  const std::size_t rest = data.size() - i;
  if (rest == 1) {
    const auto n = std::to_integer<std::uint32_t>(data[i]) << 16;
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.append("==");
  } else if (rest == 2) {
    const auto n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                   (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    out.push_back('=');
  }
  return out;
}

std::expected<std::vector<std::byte>, ImageError> base64_decode(std::string_view text) {
  std::vector<std::byte> out;
  out.reserve((text.size() / 4) * 3);

  std::uint32_t quantum = 0;
  int filled = 0;   // sextets in the current quantum
  int padding = 0;  // '=' seen so far

  for (const char c : text) {
    const std::int8_t v = kReverse[static_cast<unsigned char>(c)];
    if (v == kSkip) continue;
    if (v == kInvalid) return std::unexpected(ImageError::InvalidBase64);
    if (v == kPad) {
      // Padding may only complete the last quantum, after 2 or 3 sextets.
      if (filled + padding < 2) return std::unexpected(ImageError::InvalidBase64);
      ++padding;
      if (filled + padding > 4) return std::unexpected(ImageError::InvalidBase64);
      continue;
    }
    if (padding > 0) return std::unexpected(ImageError::InvalidBase64);

    quantum = (quantum << 6) | static_cast<std::uint32_t>(v);
    if (++filled == 4) {
      out.push_back(static_cast<std::byte>((quantum >> 16) & 0xff));
      out.push_back(static_cast<std::byte>((quantum >> 8) & 0xff));
      out.push_back(static_cast<std::byte>(quantum & 0xff));
      quantum = 0;
      filled = 0;
    }
  }

  if (filled == 0 && padding == 0) return out;
  if (filled + padding != 4) return std::unexpected(ImageError::InvalidBase64);

  if (filled == 2) {
    quantum <<= 12;
    out.push_back(static_cast<std::byte>((quantum >> 16) & 0xff));
  } else if (filled == 3) {
    quantum <<= 6;
    out.push_back(static_cast<std::byte>((quantum >> 16) & 0xff));
    out.push_back(static_cast<std::byte>((quantum >> 8) & 0xff));
  } else {
    return std::unexpected(ImageError::InvalidBase64);
  }
  return out;
}

}  // namespace pictor::core
