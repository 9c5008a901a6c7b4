#include "PrimeGlyph/render/ImageEncode.hpp"

#include <string>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STB_IMAGE_WRITE_STATIC
#include <stb_image_write.h>

namespace PrimeGlyph {

namespace {

void append_bytes(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<uint8_t>*>(context);
  auto* bytes = static_cast<uint8_t const*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

} // namespace

auto EncodePgm(CoverageImage const& image) -> std::vector<uint8_t> {
  std::string header = "P5\n" + std::to_string(image.width) + " " + std::to_string(image.height) + "\n255\n";
  std::vector<uint8_t> out;
  out.reserve(header.size() + image.pixels.size());
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), image.pixels.begin(), image.pixels.end());
  return out;
}

auto EncodePng(CoverageImage const& image) -> std::optional<std::vector<uint8_t>> {
  if (image.width == 0 || image.height == 0 || image.pixels.size() != static_cast<size_t>(image.width) * image.height) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  int ok = stbi_write_png_to_func(append_bytes,
                                  &out,
                                  static_cast<int>(image.width),
                                  static_cast<int>(image.height),
                                  1,
                                  image.pixels.data(),
                                  static_cast<int>(image.width));
  if (!ok || out.empty()) return std::nullopt;
  return out;
}

} // namespace PrimeGlyph
