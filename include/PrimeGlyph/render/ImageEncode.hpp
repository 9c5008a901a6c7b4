#pragma once

#include "PrimeGlyph/render/CoverageImage.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace PrimeGlyph {

// Binary P5 graymap: "P5\n<w> <h>\n255\n" followed by the rows.
auto EncodePgm(CoverageImage const& image) -> std::vector<uint8_t>;

// 8-bit grayscale PNG. Empty optional when the encoder fails.
auto EncodePng(CoverageImage const& image) -> std::optional<std::vector<uint8_t>>;

} // namespace PrimeGlyph
