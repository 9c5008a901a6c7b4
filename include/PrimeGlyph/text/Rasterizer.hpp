#pragma once

#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/render/CoverageImage.hpp"
#include "PrimeGlyph/text/Shaper.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace PrimeGlyph {

// Scan-converts a shaped run into a width x height coverage canvas. The pen
// starts at x = 0 on a baseline placed at 75% of the canvas height; ink that
// falls outside the canvas is clipped. Overlapping glyphs are blended as
// dst + src * (255 - dst) / 255.
auto RasterizeRun(FontInstance& font,
                  ShapedRun const& run,
                  uint32_t width,
                  uint32_t height,
                  std::string& error) -> std::optional<CoverageImage>;

} // namespace PrimeGlyph
