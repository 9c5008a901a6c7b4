#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <thread>

namespace PrimeGlyph {

namespace {

auto env_unsigned(char const* name) -> std::optional<unsigned long> {
  auto env = std::getenv(name);
  if (!env || *env == '\0') return std::nullopt;
  char* end = nullptr;
  unsigned long value = std::strtoul(env, &end, 10);
  if (end == env || *end != '\0') {
    Log().warn("Ignoring {}='{}': expected an unsigned integer", name, env);
    return std::nullopt;
  }
  return value;
}

auto env_string(char const* name) -> std::optional<std::string> {
  auto env = std::getenv(name);
  if (!env || *env == '\0') return std::nullopt;
  return std::string{env};
}

} // namespace

auto LoadConfigFromEnv(EngineConfig base) -> EngineConfig {
  if (auto v = env_unsigned("PRIMEGLYPH_FONT_CACHE")) base.fontCacheCapacity = static_cast<size_t>(*v);
  if (auto v = env_unsigned("PRIMEGLYPH_GLYPH_CACHE")) base.glyphCacheCapacity = static_cast<size_t>(*v);
  if (auto v = env_unsigned("PRIMEGLYPH_WORKERS")) base.workerCount = static_cast<uint32_t>(*v);
  if (auto v = env_unsigned("PRIMEGLYPH_TIMEOUT_MS")) base.jobTimeoutMs = static_cast<uint32_t>(*v);
  if (auto v = env_unsigned("PRIMEGLYPH_MAX_JOBS")) base.maxJobsPerBatch = static_cast<size_t>(*v);
  if (auto v = env_string("PRIMEGLYPH_BASE_DIR")) base.baseDir = *v;
  if (auto v = env_string("PRIMEGLYPH_LOG_LEVEL")) base.logLevel = *v;
  return base;
}

auto ResolveWorkerCount(EngineConfig const& config) -> uint32_t {
  if (config.workerCount > 0) return config.workerCount;
  return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace PrimeGlyph
