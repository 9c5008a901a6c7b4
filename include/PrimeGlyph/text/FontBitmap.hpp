#pragma once

#include <cstdint>
#include <vector>

namespace PrimeGlyph {

enum class FontBitmapFormat : uint8_t {
  Gray8,
  Mono1,
};

// Borrowed view of a rasterizer-owned glyph bitmap. A negative pitch means
// the rows are stored bottom-up.
struct FontBitmapView {
  const uint8_t* buffer = nullptr;
  int32_t width = 0;
  int32_t height = 0;
  int32_t pitch = 0;
  FontBitmapFormat format = FontBitmapFormat::Gray8;
};

// Copies the view into a top-down 8-bit coverage buffer with stride == width.
bool ConvertFontBitmapToCoverage(FontBitmapView view,
                                 std::vector<uint8_t>& outPixels,
                                 int32_t& outStride);

} // namespace PrimeGlyph
