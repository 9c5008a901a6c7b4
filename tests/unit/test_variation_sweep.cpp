#include "PrimeGlyph/exec/VariationSweep.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

using namespace PrimeGlyph;
using PrimeGlyphTest::find_system_font_file;
using PrimeGlyphTest::make_job;
using PrimeGlyphTest::test_config;

namespace {

struct Fixture {
  EngineConfig config = test_config();
  FontCache fonts{config.fontCacheCapacity};
  GlyphCache glyphs{config.glyphCacheCapacity};
  RenderContext context{fonts, glyphs, config};
};

auto weight_sweep() -> std::vector<VariationCoords> {
  return {{{"wght", 100.0f}}, {{"wght", 400.0f}}, {{"wght", 700.0f}}, {{"wght", 900.0f}}};
}

} // namespace

TEST_SUITE_BEGIN("primeglyph.exec");

TEST_CASE("empty_sweep") {
  Fixture f;
  Error error;
  auto points = RenderVariationSweep(make_job("", "a.ttf"), {}, f.context, {}, &error);
  REQUIRE(points);
  CHECK(points->empty());
  CHECK_FALSE(error);
  CHECK(RenderVariationSweepWithFallback(make_job("", "a.ttf"), {}, f.context).empty());
}

TEST_CASE("failed_points") {
  Fixture f;
  auto job = make_job("", "/definitely/not/here.ttf");
  Error error;
  CHECK_FALSE(RenderVariationSweep(job, weight_sweep(), f.context, {}, &error));
  CHECK(error.code == ErrorCode::RenderFailed);
  CHECK(error.message.rfind("Variation sweep point 0 failed", 0) == 0);

  auto slots = RenderVariationSweepWithFallback(job, weight_sweep(), f.context, SweepOptions{2});
  REQUIRE(slots.size() == 4u);
  for (auto const& slot : slots) CHECK_FALSE(slot.has_value());
}

TEST_CASE("sweep_keeps_input_order") {
  auto fontPath = find_system_font_file();
  if (!fontPath) return;

  Fixture f;
  auto coords = weight_sweep();
  auto job = make_job("", fontPath->string(), "Sweep", RenderFormat::Png);
  Error error;
  auto points = RenderVariationSweep(job, coords, f.context, SweepOptions{3}, &error);
  REQUIRE_MESSAGE(points, error.message);
  REQUIRE(points->size() == coords.size());
  for (size_t i = 0; i < coords.size(); ++i) {
    CHECK((*points)[i].coords == coords[i]);
    CHECK((*points)[i].metrics.density > 0.0);
    CHECK((*points)[i].metrics.density <= 1.0);
    CHECK((*points)[i].renderMs >= 0.0);
  }
  CHECK_MESSAGE(f.glyphs.size() >= 1u, "points render as metrics");
}

TEST_SUITE_END();
