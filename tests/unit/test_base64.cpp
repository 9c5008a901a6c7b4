#include "PrimeGlyph/util/Base64.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace PrimeGlyph;

namespace {

auto encode_text(std::string const& text) -> std::string {
  std::vector<uint8_t> bytes(text.begin(), text.end());
  return EncodeBase64(bytes);
}

} // namespace

TEST_SUITE_BEGIN("primeglyph.util");

TEST_CASE("encode_known_vectors") {
  CHECK(encode_text("") == "");
  CHECK(encode_text("f") == "Zg==");
  CHECK(encode_text("fo") == "Zm8=");
  CHECK(encode_text("foo") == "Zm9v");
  CHECK(encode_text("foobar") == "Zm9vYmFy");
}

TEST_CASE("decode_binary_payload") {
  std::vector<uint8_t> bytes = {0x00, 0xFF, 0x10, 0x80, 0x7F};
  auto decoded = DecodeBase64(EncodeBase64(bytes));
  REQUIRE(decoded.has_value());
  CHECK(*decoded == bytes);
}

TEST_CASE("decode_rejects_garbage") {
  CHECK_FALSE(DecodeBase64("Zm9v!").has_value());
  CHECK_FALSE(DecodeBase64("Zg=").has_value());
  CHECK_FALSE(DecodeBase64("Z===").has_value());
}

TEST_SUITE_END();
