#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace PrimeGlyph {

// Single-channel 8-bit coverage, row-major, stride == width.
// 0 is background, 255 full ink.
struct CoverageImage {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels;

  CoverageImage() = default;
  CoverageImage(uint32_t w, uint32_t h)
    : width(w), height(h), pixels(static_cast<size_t>(w) * h, 0u) {}

  bool empty() const { return pixels.empty(); }
  auto at(uint32_t x, uint32_t y) const -> uint8_t {
    return pixels[static_cast<size_t>(y) * width + x];
  }
};

} // namespace PrimeGlyph
