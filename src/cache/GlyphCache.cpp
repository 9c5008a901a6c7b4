#include "PrimeGlyph/cache/GlyphCache.hpp"
#include "PrimeGlyph/util/Hash.hpp"

namespace PrimeGlyph {

namespace {

auto hash_optional(uint64_t h, std::optional<std::string> const& value) -> uint64_t {
  if (!value) return fnv1a_hash(h, uint64_t{0});
  return fnv1a_hash(fnv1a_hash(h, uint64_t{1}), *value);
}

} // namespace

bool GlyphKey::operator==(GlyphKey const& other) const {
  return kind == other.kind &&
         width == other.width &&
         height == other.height &&
         size == other.size &&
         font == other.font &&
         text.content == other.text.content &&
         text.script == other.text.script &&
         text.direction == other.text.direction &&
         text.language == other.text.language &&
         text.features == other.text.features;
}

size_t GlyphKeyHash::operator()(GlyphKey const& key) const {
  uint64_t h = static_cast<uint64_t>(FontKeyHash{}(key.font));
  h = fnv1a_hash(h, key.text.content);
  h = hash_optional(h, key.text.script);
  h = hash_optional(h, key.text.direction);
  h = hash_optional(h, key.text.language);
  for (auto const& feature : key.text.features) {
    h = fnv1a_hash(h, feature);
  }
  h = fnv1a_hash(h, key.size);
  h = fnv1a_hash(h, static_cast<uint64_t>(static_cast<uint32_t>(key.width)));
  h = fnv1a_hash(h, static_cast<uint64_t>(static_cast<uint32_t>(key.height)));
  h = fnv1a_hash(h, static_cast<uint64_t>(key.kind));
  return static_cast<size_t>(h);
}

auto MakeGlyphKey(FontKey const& font, JobSpec const& job) -> GlyphKey {
  GlyphKey key;
  key.font = font;
  key.text = job.text;
  key.size = job.font.size;
  key.width = job.rendering.width;
  key.height = job.rendering.height;
  key.kind = job.rendering.format == RenderFormat::Metrics ? RasterKind::MetricsOnly : RasterKind::Coverage;
  return key;
}

} // namespace PrimeGlyph
