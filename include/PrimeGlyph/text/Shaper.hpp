#pragma once

#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PrimeGlyph {

// Positions are in pixels at the shaped size.
struct ShapedGlyph {
  uint32_t glyphId = 0;
  uint32_t cluster = 0;
  float xAdvance = 0.0f;
  float yAdvance = 0.0f;
  float xOffset = 0.0f;
  float yOffset = 0.0f;
};

struct ShapedRun {
  float sizePx = 0.0f;
  std::vector<ShapedGlyph> glyphs;

  auto advanceWidth() const -> float;
};

// Shapes one run with HarfBuzz. Unset script/direction/language are guessed
// from the text. Fails with a "Shaping error: ..." message when a property or
// feature is not understood or nothing comes out.
auto ShapeText(FontInstance& font,
               TextRun const& run,
               float sizePx,
               std::string& error) -> std::optional<ShapedRun>;

} // namespace PrimeGlyph
