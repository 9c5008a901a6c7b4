#include "PrimeGlyph/text/Rasterizer.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/text/FontBitmap.hpp"

#include <cmath>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

namespace PrimeGlyph {

namespace {

void blend_bitmap(CoverageImage& canvas,
                  std::vector<uint8_t> const& src,
                  int32_t srcWidth,
                  int32_t srcHeight,
                  int32_t originX,
                  int32_t originY) {
  int32_t canvasW = static_cast<int32_t>(canvas.width);
  int32_t canvasH = static_cast<int32_t>(canvas.height);
  for (int32_t y = 0; y < srcHeight; ++y) {
    int32_t dy = originY + y;
    if (dy < 0 || dy >= canvasH) continue;
    for (int32_t x = 0; x < srcWidth; ++x) {
      int32_t dx = originX + x;
      if (dx < 0 || dx >= canvasW) continue;
      uint32_t a = src[static_cast<size_t>(y) * srcWidth + x];
      if (a == 0) continue;
      uint8_t& dst = canvas.pixels[static_cast<size_t>(dy) * canvas.width + dx];
      uint32_t value = dst + a * (255u - dst) / 255u;
      dst = static_cast<uint8_t>(value > 255u ? 255u : value);
    }
  }
}

} // namespace

auto RasterizeRun(FontInstance& font,
                  ShapedRun const& run,
                  uint32_t width,
                  uint32_t height,
                  std::string& error) -> std::optional<CoverageImage> {
  if (width == 0 || height == 0) {
    error = "Invalid canvas dimensions " + std::to_string(width) + "x" + std::to_string(height);
    return std::nullopt;
  }

  CoverageImage canvas(width, height);
  float baseline = static_cast<float>(height) * 0.75f;
  float penX = 0.0f;
  float penY = 0.0f;

  auto lock = font.lock();
  if (!font.applySize(run.sizePx)) {
    error = "Rendering error: cannot set font size " + std::to_string(run.sizePx) + " on '" + font.path() + "'";
    return std::nullopt;
  }
  FT_Face face = font.face();
  FT_Int32 loadFlags = font.isScalable() ? (FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP) : FT_LOAD_DEFAULT;

  std::vector<uint8_t> coverage;
  for (auto const& glyph : run.glyphs) {
    float x = penX + glyph.xOffset;
    float y = baseline - (penY + glyph.yOffset);
    penX += glyph.xAdvance;
    penY += glyph.yAdvance;

    if (FT_Load_Glyph(face, glyph.glyphId, loadFlags) != 0) {
      Log().warn("Skipping glyph {} of '{}': load failed", glyph.glyphId, font.path());
      continue;
    }
    FT_GlyphSlot slot = face->glyph;
    float floorX = std::floor(x);
    float floorY = std::floor(y);
    if (slot->format == FT_GLYPH_FORMAT_OUTLINE) {
      // Subpixel pen position; y is up in outline space.
      FT_Outline_Translate(&slot->outline,
                           static_cast<FT_Pos>(std::lround((x - floorX) * 64.0f)),
                           static_cast<FT_Pos>(-std::lround((y - floorY) * 64.0f)));
    }
    if (slot->format != FT_GLYPH_FORMAT_BITMAP &&
        FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
      Log().warn("Skipping glyph {} of '{}': scan conversion failed", glyph.glyphId, font.path());
      continue;
    }

    FT_Bitmap const& bm = slot->bitmap;
    if (!bm.buffer || bm.width == 0 || bm.rows == 0) continue;
    FontBitmapView view;
    view.buffer = bm.buffer;
    view.width = static_cast<int32_t>(bm.width);
    view.height = static_cast<int32_t>(bm.rows);
    view.pitch = bm.pitch;
    if (bm.pixel_mode == FT_PIXEL_MODE_MONO) {
      view.format = FontBitmapFormat::Mono1;
    } else if (bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
      view.format = FontBitmapFormat::Gray8;
    } else {
      Log().warn("Skipping glyph {} of '{}': unsupported pixel mode {}", glyph.glyphId, font.path(),
                 static_cast<int>(bm.pixel_mode));
      continue;
    }

    int32_t stride = 0;
    if (!ConvertFontBitmapToCoverage(view, coverage, stride)) {
      error = "Rendering error: failed to convert glyph " + std::to_string(glyph.glyphId);
      return std::nullopt;
    }
    blend_bitmap(canvas,
                 coverage,
                 view.width,
                 view.height,
                 static_cast<int32_t>(floorX) + slot->bitmap_left,
                 static_cast<int32_t>(floorY) - slot->bitmap_top);
  }
  return canvas;
}

} // namespace PrimeGlyph
