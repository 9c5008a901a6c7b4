#pragma once

#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/cache/GlyphCache.hpp"
#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/job/JobResult.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"
#include "PrimeGlyph/render/CoverageImage.hpp"

#include <functional>
#include <memory>
#include <string>

namespace PrimeGlyph {

// Caches and limits a render runs against. The caches are shared by every
// worker of a batch or session; the context itself holds no state.
struct RenderContext {
  FontCache& fonts;
  GlyphCache& glyphs;
  EngineConfig const& config;
};

// Runs body and turns any exception it throws into an error result for id.
auto GuardJob(std::string const& id, std::function<JobResult()> const& body) -> JobResult;

// Validates, loads the font, shapes, rasterizes, measures and encodes one job.
// Every failure is reported inside the returned result.
auto RenderJob(JobSpec const& job, RenderContext& context) -> JobResult;

// Same path as RenderJob but hands back the raw coverage canvas. The job's
// format is ignored. Returns nullptr with a subsystem-prefixed message.
auto RenderCoverage(JobSpec const& job,
                    RenderContext& context,
                    std::string& error) -> std::shared_ptr<CoverageImage const>;

} // namespace PrimeGlyph
