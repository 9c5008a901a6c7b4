#pragma once

#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/cache/LruCache.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"
#include "PrimeGlyph/render/CoverageImage.hpp"

#include <array>
#include <cstdint>
#include <memory>

namespace PrimeGlyph {

enum class RasterKind : uint8_t {
  // Pixels are kept for image output.
  Coverage = 0,
  // Only metrics are kept.
  MetricsOnly,
};

// Everything that changes pixels: the font instance, the full text run, the
// size and the canvas. Output container and encoding are not part of it, so
// pgm and png requests for the same run share an entry.
struct GlyphKey {
  FontKey font;
  TextRun text;
  float size = 0.0f;
  int32_t width = 0;
  int32_t height = 0;
  RasterKind kind = RasterKind::Coverage;

  bool operator==(GlyphKey const& other) const;
};

struct GlyphKeyHash {
  size_t operator()(GlyphKey const& key) const;
};

struct GlyphEntry {
  std::shared_ptr<CoverageImage const> image;
  double density = 0.0;
  double beam = 0.0;
  std::array<uint32_t, 4> bbox{};
};

using GlyphCache = LruCache<GlyphKey, GlyphEntry const, GlyphKeyHash>;

auto MakeGlyphKey(FontKey const& font, JobSpec const& job) -> GlyphKey;

} // namespace PrimeGlyph
