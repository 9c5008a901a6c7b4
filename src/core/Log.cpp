#include "PrimeGlyph/core/Log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>

namespace PrimeGlyph {

namespace {

constexpr char const* LoggerName = "primeglyph";

auto create_logger() -> std::shared_ptr<spdlog::logger> {
  if (auto existing = spdlog::get(LoggerName)) return existing;
  auto logger = spdlog::stderr_color_mt(LoggerName);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
  logger->set_level(spdlog::level::info);
  return logger;
}

} // namespace

auto Log() -> spdlog::logger& {
  static std::shared_ptr<spdlog::logger> logger = create_logger();
  return *logger;
}

void InitLogging(EngineConfig const& config) {
  static std::mutex initMutex;
  std::lock_guard<std::mutex> lock(initMutex);
  auto& logger = Log();
  auto level = spdlog::level::from_str(config.logLevel);
  // from_str maps unknown names to off; keep info for those.
  if (level == spdlog::level::off && config.logLevel != "off") {
    level = spdlog::level::info;
  }
  logger.set_level(level);
  spdlog::cfg::load_env_levels();
}

} // namespace PrimeGlyph
