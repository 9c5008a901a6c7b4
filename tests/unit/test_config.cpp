#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Log.hpp"

#include <doctest/doctest.h>

#include <cstdlib>

using namespace PrimeGlyph;

TEST_SUITE_BEGIN("primeglyph.core");

TEST_CASE("defaults") {
  EngineConfig config;
  CHECK(config.fontCacheCapacity == 512u);
  CHECK(config.glyphCacheCapacity == 2048u);
  CHECK(config.workerCount == 0u);
  CHECK(config.jobTimeoutMs == 0u);
  CHECK(config.maxJobsPerBatch == 10000u);
  CHECK(config.maxJsonBytes == 10u * 1024u * 1024u);
  CHECK(config.maxFontFileBytes == 50u * 1024u * 1024u);
  CHECK(config.logLevel == "info");
}

TEST_CASE("env_overrides") {
  setenv("PRIMEGLYPH_FONT_CACHE", "7", 1);
  setenv("PRIMEGLYPH_WORKERS", "3", 1);
  setenv("PRIMEGLYPH_TIMEOUT_MS", "not-a-number", 1);
  setenv("PRIMEGLYPH_BASE_DIR", "/srv/fonts", 1);

  EngineConfig base;
  base.jobTimeoutMs = 250;
  auto config = LoadConfigFromEnv(base);
  CHECK(config.fontCacheCapacity == 7u);
  CHECK(config.workerCount == 3u);
  CHECK_MESSAGE(config.jobTimeoutMs == 250u, "unparsable value keeps the base");
  CHECK(config.baseDir == "/srv/fonts");
  CHECK(config.glyphCacheCapacity == base.glyphCacheCapacity);

  unsetenv("PRIMEGLYPH_FONT_CACHE");
  unsetenv("PRIMEGLYPH_WORKERS");
  unsetenv("PRIMEGLYPH_TIMEOUT_MS");
  unsetenv("PRIMEGLYPH_BASE_DIR");
}

TEST_CASE("worker_count_resolution") {
  EngineConfig config;
  CHECK(ResolveWorkerCount(config) >= 1u);
  config.workerCount = 5;
  CHECK(ResolveWorkerCount(config) == 5u);
}

TEST_CASE("log_level_from_config") {
  EngineConfig config;
  config.logLevel = "error";
  InitLogging(config);
  CHECK(Log().level() == spdlog::level::err);
  config.logLevel = "bogus";
  InitLogging(config);
  CHECK_MESSAGE(Log().level() == spdlog::level::info, "unknown level falls back to info");
  config.logLevel = "warn";
  InitLogging(config);
}

TEST_SUITE_END();
