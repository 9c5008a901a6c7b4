#pragma once

#include <bit>
#include <cstdint>
#include <string_view>

namespace PrimeGlyph {

inline constexpr uint64_t HashSeed = 1469598103934665603ull;

inline auto fnv1a_hash(uint64_t h, uint64_t v) -> uint64_t {
  constexpr uint64_t Prime = 1099511628211ull;
  h ^= v;
  h *= Prime;
  return h;
}

inline auto fnv1a_hash(uint64_t h, std::string_view text) -> uint64_t {
  for (unsigned char c : text) {
    h = fnv1a_hash(h, static_cast<uint64_t>(c));
  }
  // Length terminator keeps ("ab","c") and ("a","bc") apart.
  return fnv1a_hash(h, static_cast<uint64_t>(text.size()) + 0x9e3779b9u);
}

// -0.0f compares equal to 0.0f, so both must hash the same.
inline auto fnv1a_hash(uint64_t h, float value) -> uint64_t {
  if (value == 0.0f) value = 0.0f;
  return fnv1a_hash(h, static_cast<uint64_t>(std::bit_cast<uint32_t>(value)));
}

} // namespace PrimeGlyph
