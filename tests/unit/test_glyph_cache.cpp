#include "PrimeGlyph/cache/GlyphCache.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

using namespace PrimeGlyph;
using PrimeGlyphTest::make_job;

TEST_SUITE_BEGIN("primeglyph.cache");

TEST_CASE("glyph_key_ignores_container_and_id") {
  FontKey font{"/fonts/a.ttf", 0, {}};
  auto pgm = make_job("one", "a.ttf", "Hi", RenderFormat::Pgm);
  auto png = make_job("two", "b.ttf", "Hi", RenderFormat::Png);
  png.rendering.encoding = RenderEncoding::Base64;

  GlyphKey a = MakeGlyphKey(font, pgm);
  GlyphKey b = MakeGlyphKey(font, png);
  CHECK(a == b);
  CHECK(GlyphKeyHash{}(a) == GlyphKeyHash{}(b));
  CHECK(a.kind == RasterKind::Coverage);
}

TEST_CASE("glyph_key_separates_pixel_inputs") {
  FontKey font{"/fonts/a.ttf", 0, {}};
  auto job = make_job("j", "a.ttf", "Hi", RenderFormat::Pgm);
  GlyphKey base = MakeGlyphKey(font, job);

  auto metrics = job;
  metrics.rendering.format = RenderFormat::Metrics;
  GlyphKey m = MakeGlyphKey(font, metrics);
  CHECK(m.kind == RasterKind::MetricsOnly);
  CHECK_FALSE(base == m);

  auto bigger = job;
  bigger.font.size = 48.0f;
  CHECK_FALSE(base == MakeGlyphKey(font, bigger));

  auto wider = job;
  wider.rendering.width += 1;
  CHECK_FALSE(base == MakeGlyphKey(font, wider));

  auto rtl = job;
  rtl.text.direction = "rtl";
  CHECK_FALSE(base == MakeGlyphKey(font, rtl));

  auto liga = job;
  liga.text.features = {"-liga"};
  CHECK_FALSE(base == MakeGlyphKey(font, liga));

  FontKey heavy{"/fonts/a.ttf", 0, {{"wght", 700.0f}}};
  CHECK_MESSAGE(!(base == MakeGlyphKey(heavy, job)), "variation instance is part of the key");
}

TEST_CASE("glyph_cache_shares_entries") {
  GlyphCache cache(4);
  FontKey font{"/fonts/a.ttf", 0, {}};
  auto key = MakeGlyphKey(font, make_job("a", "a.ttf"));
  int loads = 0;
  auto loader = [&](std::string&) {
    ++loads;
    auto entry = std::make_shared<GlyphEntry>();
    entry->density = 0.25;
    return std::shared_ptr<GlyphEntry const>(entry);
  };
  auto first = cache.getOrLoad(key, loader);
  auto second = cache.getOrLoad(key, loader);
  REQUIRE(first);
  CHECK(first == second);
  CHECK(loads == 1);
  CHECK(cache.stats().hits == 1u);
  CHECK(cache.stats().misses == 1u);
}

TEST_CASE("negative_zero_coordinate_is_the_same_key") {
  FontKey upright{"/fonts/a.ttf", 0, {{"slnt", 0.0f}}};
  FontKey negated{"/fonts/a.ttf", 0, {{"slnt", -0.0f}}};
  REQUIRE(upright == negated);
  CHECK_MESSAGE(FontKeyHash{}(upright) == FontKeyHash{}(negated), "equal keys must hash equal");

  auto job = make_job("j", "a.ttf");
  GlyphKey a = MakeGlyphKey(upright, job);
  GlyphKey b = MakeGlyphKey(negated, job);
  CHECK(GlyphKeyHash{}(a) == GlyphKeyHash{}(b));

  GlyphCache cache(4);
  int loads = 0;
  auto loader = [&](std::string&) {
    ++loads;
    return std::shared_ptr<GlyphEntry const>(std::make_shared<GlyphEntry>());
  };
  auto first = cache.getOrLoad(a, loader);
  auto second = cache.getOrLoad(b, loader);
  REQUIRE(first);
  CHECK(first == second);
  CHECK(loads == 1);
  CHECK(cache.size() == 1u);
}

TEST_SUITE_END();
