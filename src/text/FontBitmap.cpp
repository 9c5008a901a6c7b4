#include "PrimeGlyph/text/FontBitmap.hpp"

#include <algorithm>

namespace PrimeGlyph {

bool ConvertFontBitmapToCoverage(FontBitmapView view,
                                 std::vector<uint8_t>& outPixels,
                                 int32_t& outStride) {
  outPixels.clear();
  outStride = 0;
  if (!view.buffer || view.width <= 0 || view.height <= 0 || view.pitch == 0) return false;

  int32_t absPitch = view.pitch > 0 ? view.pitch : -view.pitch;
  int32_t minPitch = view.format == FontBitmapFormat::Mono1 ? (view.width + 7) / 8 : view.width;
  if (absPitch < minPitch) return false;

  outStride = view.width;
  outPixels.assign(static_cast<size_t>(view.width) * view.height, 0u);

  for (int32_t y = 0; y < view.height; ++y) {
    int32_t srcRow = view.pitch > 0 ? y : view.height - 1 - y;
    const uint8_t* src = view.buffer + static_cast<size_t>(srcRow) * absPitch;
    uint8_t* dst = outPixels.data() + static_cast<size_t>(y) * outStride;
    if (view.format == FontBitmapFormat::Gray8) {
      std::copy_n(src, view.width, dst);
      continue;
    }
    for (int32_t x = 0; x < view.width; ++x) {
      uint8_t bit = 0x80u >> (x % 8);
      dst[x] = (src[x / 8] & bit) ? 255u : 0u;
    }
  }
  return true;
}

} // namespace PrimeGlyph
