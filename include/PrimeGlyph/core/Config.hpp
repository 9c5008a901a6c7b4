#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace PrimeGlyph {

struct EngineConfig {
  size_t fontCacheCapacity = 512;
  size_t glyphCacheCapacity = 2048;
  // 0 picks std::thread::hardware_concurrency().
  uint32_t workerCount = 0;
  // 0 disables the per-job timeout.
  uint32_t jobTimeoutMs = 0;
  // Empty leaves font paths unconstrained.
  std::string baseDir;
  size_t maxJobsPerBatch = 10000;
  size_t maxJsonBytes = 10u * 1024u * 1024u;
  size_t maxFontFileBytes = 50u * 1024u * 1024u;
  size_t maxTextBytes = 10000;
  uint32_t maxCanvasDimension = 10000;
  float maxFontSize = 10000.0f;
  std::string logLevel = "info";
};

auto LoadConfigFromEnv(EngineConfig base = {}) -> EngineConfig;

auto ResolveWorkerCount(EngineConfig const& config) -> uint32_t;

} // namespace PrimeGlyph
