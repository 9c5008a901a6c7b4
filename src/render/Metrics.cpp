#include "PrimeGlyph/render/Metrics.hpp"

#include <algorithm>

namespace PrimeGlyph {

auto Density(CoverageImage const& image) -> double {
  if (image.pixels.empty()) return 0.0;
  uint64_t sum = 0;
  for (uint8_t v : image.pixels) sum += v;
  double density = static_cast<double>(sum) / (255.0 * static_cast<double>(image.pixels.size()));
  return std::clamp(density, 0.0, 1.0);
}

auto Beam(CoverageImage const& image) -> double {
  if (image.pixels.empty()) return 0.0;
  size_t longest = 0;
  size_t current = 0;
  for (uint8_t v : image.pixels) {
    if (v != 0) {
      ++current;
      longest = std::max(longest, current);
    } else {
      current = 0;
    }
  }
  double beam = static_cast<double>(longest) / static_cast<double>(image.pixels.size());
  return std::clamp(beam, 0.0, 1.0);
}

auto BoundingBox(CoverageImage const& image) -> std::array<uint32_t, 4> {
  uint32_t minX = image.width;
  uint32_t minY = image.height;
  uint32_t maxX = 0;
  uint32_t maxY = 0;
  bool any = false;
  for (uint32_t y = 0; y < image.height; ++y) {
    for (uint32_t x = 0; x < image.width; ++x) {
      if (image.at(x, y) == 0) continue;
      any = true;
      minX = std::min(minX, x);
      minY = std::min(minY, y);
      maxX = std::max(maxX, x);
      maxY = std::max(maxY, y);
    }
  }
  if (!any) return {0u, 0u, 0u, 0u};
  return {minX, minY, maxX - minX + 1, maxY - minY + 1};
}

} // namespace PrimeGlyph
