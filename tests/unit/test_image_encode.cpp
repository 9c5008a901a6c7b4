#include "PrimeGlyph/render/ImageEncode.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace PrimeGlyph;

TEST_SUITE_BEGIN("primeglyph.render");

TEST_CASE("pgm_header_and_body") {
  CoverageImage image(3, 2);
  image.pixels = {0, 128, 255, 1, 2, 3};
  auto bytes = EncodePgm(image);
  std::string header = "P5\n3 2\n255\n";
  REQUIRE(bytes.size() == header.size() + 6);
  CHECK(std::string(bytes.begin(), bytes.begin() + static_cast<long>(header.size())) == header);
  CHECK(bytes[header.size()] == 0);
  CHECK(bytes[header.size() + 2] == 255);
  CHECK(bytes.back() == 3);
}

TEST_CASE("png_signature") {
  CoverageImage image(8, 8);
  image.pixels[9] = 200;
  auto png = EncodePng(image);
  REQUIRE(png.has_value());
  REQUIRE(png->size() > 8);
  uint8_t const signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  for (size_t i = 0; i < 8; ++i) {
    CHECK((*png)[i] == signature[i]);
  }
}

TEST_CASE("png_rejects_empty_image") {
  CoverageImage image;
  CHECK_FALSE(EncodePng(image).has_value());
}

TEST_SUITE_END();
