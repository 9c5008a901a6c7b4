#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

namespace PrimeGlyph {

// Counters of one cache tier.
struct TierStats {
  size_t capacity = 0;
  size_t entries = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
};

// Point-in-time snapshot of both tiers. Advisory only.
struct CacheStats {
  TierStats font;
  TierStats glyph;
};

auto ToJson(CacheStats const& stats) -> nlohmann::json;

} // namespace PrimeGlyph

inline auto PrimeGlyph::ToJson(CacheStats const& stats) -> nlohmann::json {
  return {
    {"capacity", stats.font.capacity},
    {"entries", stats.font.entries},
    {"hits", stats.font.hits},
    {"misses", stats.font.misses},
    {"glyph_capacity", stats.glyph.capacity},
    {"glyph_entries", stats.glyph.entries},
    {"glyph_hits", stats.glyph.hits},
    {"glyph_misses", stats.glyph.misses},
  };
}
