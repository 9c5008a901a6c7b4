#pragma once

#include "PrimeGlyph/core/Config.hpp"

#include <spdlog/spdlog.h>

namespace PrimeGlyph {

// Shared "primeglyph" logger. Writes to stderr so stdout stays free for JSONL.
auto Log() -> spdlog::logger&;

void InitLogging(EngineConfig const& config);

} // namespace PrimeGlyph
