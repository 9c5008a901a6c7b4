#include "PrimeGlyph/util/Base64.hpp"

namespace PrimeGlyph {

namespace {

constexpr char Base64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t Invalid = 255;

constexpr uint8_t Base64DecodeTable[128] = {
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,  62, 255, 255, 255,  63,
     52,  53,  54,  55,  56,  57,  58,  59,  60,  61, 255, 255, 255, 255, 255, 255,
    255,   0,   1,   2,   3,   4,   5,   6,   7,   8,   9,  10,  11,  12,  13,  14,
     15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25, 255, 255, 255, 255, 255,
    255,  26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,
     41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51, 255, 255, 255, 255, 255
};

} // namespace

auto EncodeBase64(std::span<uint8_t const> data) -> std::string {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  size_t const len = data.size();
  while (i + 2 < len) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                      (static_cast<uint32_t>(data[i + 1]) << 8) |
                      static_cast<uint32_t>(data[i + 2]);
    result.push_back(Base64Chars[(triple >> 18) & 0x3F]);
    result.push_back(Base64Chars[(triple >> 12) & 0x3F]);
    result.push_back(Base64Chars[(triple >> 6) & 0x3F]);
    result.push_back(Base64Chars[triple & 0x3F]);
    i += 3;
  }

  if (i + 1 == len) {
    uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
    result.push_back(Base64Chars[(triple >> 18) & 0x3F]);
    result.push_back(Base64Chars[(triple >> 12) & 0x3F]);
    result.push_back('=');
    result.push_back('=');
  } else if (i + 2 == len) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                      (static_cast<uint32_t>(data[i + 1]) << 8);
    result.push_back(Base64Chars[(triple >> 18) & 0x3F]);
    result.push_back(Base64Chars[(triple >> 12) & 0x3F]);
    result.push_back(Base64Chars[(triple >> 6) & 0x3F]);
    result.push_back('=');
  }
  return result;
}

auto DecodeBase64(std::string_view text) -> std::optional<std::vector<uint8_t>> {
  if (text.size() % 4 != 0) return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve(text.size() / 4 * 3);

  for (size_t i = 0; i < text.size(); i += 4) {
    uint32_t values[4] = {0, 0, 0, 0};
    int padding = 0;
    for (size_t j = 0; j < 4; ++j) {
      unsigned char c = static_cast<unsigned char>(text[i + j]);
      if (c == '=') {
        // Padding is only legal in the last two positions of the final quad.
        if (i + 4 != text.size() || j < 2) return std::nullopt;
        ++padding;
        continue;
      }
      if (padding > 0) return std::nullopt;
      if (c >= 128 || Base64DecodeTable[c] == Invalid) return std::nullopt;
      values[j] = Base64DecodeTable[c];
    }
    uint32_t triple = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
    out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
    if (padding < 2) out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
    if (padding < 1) out.push_back(static_cast<uint8_t>(triple & 0xFF));
  }
  return out;
}

} // namespace PrimeGlyph
