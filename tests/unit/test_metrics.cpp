#include "PrimeGlyph/render/Metrics.hpp"

#include <doctest/doctest.h>

#include <algorithm>

using namespace PrimeGlyph;

TEST_SUITE_BEGIN("primeglyph.render");

TEST_CASE("blank_canvas_metrics") {
  CoverageImage image(16, 8);
  CHECK(Density(image) == doctest::Approx(0.0));
  CHECK(Beam(image) == doctest::Approx(0.0));
  auto box = BoundingBox(image);
  CHECK(box[0] == 0u);
  CHECK(box[1] == 0u);
  CHECK(box[2] == 0u);
  CHECK(box[3] == 0u);
}

TEST_CASE("full_canvas_metrics") {
  CoverageImage image(4, 4);
  std::fill(image.pixels.begin(), image.pixels.end(), uint8_t{255});
  CHECK(Density(image) == doctest::Approx(1.0));
  CHECK_MESSAGE(Beam(image) == doctest::Approx(1.0), "runs continue across rows");
  auto box = BoundingBox(image);
  CHECK(box == std::array<uint32_t, 4>{0u, 0u, 4u, 4u});
}

TEST_CASE("density_weights_coverage") {
  CoverageImage image(2, 2);
  image.pixels = {255, 0, 0, 0};
  CHECK(Density(image) == doctest::Approx(0.25));
  image.pixels = {51, 51, 51, 51};
  CHECK(Density(image) == doctest::Approx(0.2));
}

TEST_CASE("beam_is_longest_run") {
  CoverageImage image(5, 2);
  image.pixels = {
    1, 1, 0, 9, 9,
    9, 0, 4, 0, 0,
  };
  // 9, 9 at the end of row 0 joins the 9 starting row 1.
  CHECK(Beam(image) == doctest::Approx(3.0 / 10.0));
}

TEST_CASE("bounding_box_of_ink") {
  CoverageImage image(6, 5);
  image.pixels[1 * 6 + 2] = 10;
  image.pixels[3 * 6 + 4] = 200;
  auto box = BoundingBox(image);
  CHECK(box[0] == 2u);
  CHECK(box[1] == 1u);
  CHECK(box[2] == 3u);
  CHECK(box[3] == 3u);
}

TEST_CASE("empty_image_is_safe") {
  CoverageImage image;
  CHECK(Density(image) == doctest::Approx(0.0));
  CHECK(Beam(image) == doctest::Approx(0.0));
  CHECK(BoundingBox(image)[2] == 0u);
}

TEST_SUITE_END();
