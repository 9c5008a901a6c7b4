#pragma once

#include "PrimeGlyph/render/CoverageImage.hpp"

#include <array>
#include <cstdint>

namespace PrimeGlyph {

// Sum of coverage over 255 * area, in [0, 1]. 0 for a blank canvas.
auto Density(CoverageImage const& image) -> double;

// Longest run of consecutive non-zero bytes in row-major order over the
// canvas area, in [0, 1]. Runs continue across row ends.
auto Beam(CoverageImage const& image) -> double;

// x, y, w, h of the non-zero pixels; all zero when nothing is inked.
auto BoundingBox(CoverageImage const& image) -> std::array<uint32_t, 4>;

} // namespace PrimeGlyph
