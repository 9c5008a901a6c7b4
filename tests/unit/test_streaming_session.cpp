#include "PrimeGlyph/exec/StreamingSession.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

using namespace PrimeGlyph;
using PrimeGlyphTest::find_system_font_file;
using PrimeGlyphTest::make_job;
using PrimeGlyphTest::test_config;

TEST_SUITE_BEGIN("primeglyph.exec");

TEST_CASE("session_lifecycle") {
  StreamingSession session(test_config());
  CHECK(session.ping());
  CHECK(session.warmUp());
  CHECK_FALSE(session.warmUp(std::string{"/definitely/not/here.ttf"}));
  CHECK_FALSE(session.isClosed());

  session.close();
  CHECK(session.isClosed());
  session.close();
  CHECK(session.isClosed());
  CHECK(session.ping());
  CHECK_FALSE(session.warmUp());
  CHECK_FALSE(session.setCacheSize(4));
  CHECK_FALSE(session.setGlyphCacheSize(4));

  Error error;
  CHECK_FALSE(session.render(make_job("late", "a.ttf"), &error));
  CHECK(error.code == ErrorCode::SessionClosed);

  error = {};
  CHECK_FALSE(session.renderJson("{}", &error));
  CHECK(error.code == ErrorCode::SessionClosed);
  CHECK(session.cacheStats().font.capacity == 0u);
}

TEST_CASE("job_failures_are_results_not_errors") {
  StreamingSession session(test_config());
  Error error;
  auto result = session.render(make_job("missing", "/definitely/not/here.ttf"), &error);
  REQUIRE(result);
  CHECK_FALSE(error);
  CHECK_FALSE(result->ok());
  CHECK(result->id == "missing");
}

TEST_CASE("render_json_lines") {
  StreamingSession session(test_config());
  auto garbage = session.renderJson("not json at all");
  REQUIRE(garbage);
  auto parsed = nlohmann::json::parse(*garbage);
  CHECK(parsed["status"] == "error");
  CHECK(parsed["error"].get<std::string>().find("malformed JSON") != std::string::npos);
  CHECK(garbage->find('\n') == std::string::npos);

  auto missing = session.renderJson(
      R"({"id":"x","font":{"path":"/definitely/not/here.ttf","size":20},)"
      R"("text":{"content":"Hi"},"rendering":{"format":"metrics","width":64,"height":32}})");
  REQUIRE(missing);
  parsed = nlohmann::json::parse(*missing);
  CHECK(parsed["id"] == "x");
  CHECK(parsed["status"] == "error");
}

TEST_CASE("render_to_image_validates_parameters") {
  StreamingSession session(test_config());
  ImageRequest request;
  request.width = 32;
  request.height = 32;
  Error error;
  CHECK_FALSE(session.renderToImage(request, &error));
  CHECK(error.code == ErrorCode::InvalidRenderParams);

  request.font.path = "/definitely/not/here.ttf";
  request.font.size = 12.0f;
  request.text.content = "a";
  error = {};
  CHECK_FALSE(session.renderToImage(request, &error));
  CHECK(error.code == ErrorCode::InvalidRenderParams);
  CHECK(error.message.find("Font error") != std::string::npos);
}

TEST_CASE("cache_controls_and_stats") {
  auto config = test_config();
  config.fontCacheCapacity = 16;
  config.glyphCacheCapacity = 32;
  StreamingSession session(config);

  auto stats = session.cacheStats();
  CHECK(stats.font.capacity == 16u);
  CHECK(stats.glyph.capacity == 32u);

  CHECK(session.setCacheSize(3));
  CHECK(session.setGlyphCacheSize(5));
  stats = session.cacheStats();
  CHECK(stats.font.capacity == 3u);
  CHECK(stats.glyph.capacity == 5u);

  auto json = ToJson(stats);
  for (char const* key : {"capacity", "entries", "hits", "misses",
                          "glyph_capacity", "glyph_entries", "glyph_hits", "glyph_misses"}) {
    CHECK_MESSAGE(json.contains(key), key);
  }
}

TEST_CASE("session_renders_with_system_font") {
  auto fontPath = find_system_font_file();
  if (!fontPath) return;

  StreamingSession session(test_config());
  CHECK(session.warmUp(fontPath->string()));

  auto result = session.render(make_job("r", fontPath->string()));
  REQUIRE(result);
  CHECK_MESSAGE(result->ok(), result->error.value_or(""));

  ImageRequest request;
  request.font.path = fontPath->string();
  request.font.size = 24.0f;
  request.text.content = "Ag";
  request.width = 64;
  request.height = 40;
  Error error;
  auto image = session.renderToImage(request, &error);
  REQUIRE_MESSAGE(image, error.message);
  CHECK(image->width == 64u);
  CHECK(image->height == 40u);
  CHECK(image->pixels.size() == 64u * 40u);

  auto before = session.cacheStats();
  CHECK(before.font.entries >= 1u);
  session.close();
  CHECK_FALSE(session.renderToImage(request, &error));
  CHECK(error.code == ErrorCode::SessionClosed);
}

TEST_SUITE_END();
