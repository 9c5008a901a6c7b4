#pragma once

#include "PrimeGlyph/core/Error.hpp"
#include "PrimeGlyph/job/JobResult.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"
#include "PrimeGlyph/render/RenderPipeline.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace PrimeGlyph {

struct SweepPoint {
  // The coordinate set exactly as requested.
  VariationCoords coords;
  MetricsOutput metrics;
  double renderMs = 0.0;
};

struct SweepOptions {
  // 0 uses the context's configured worker count.
  uint32_t workerCount = 0;
};

// Renders templateJob once per coordinate set, in parallel, as metrics.
// Result i always belongs to coordSets[i]. The first failed point fails the
// whole call with ErrorCode::RenderFailed.
auto RenderVariationSweep(JobSpec const& templateJob,
                          std::vector<VariationCoords> const& coordSets,
                          RenderContext& context,
                          SweepOptions const& options = {},
                          Error* error = nullptr) -> std::optional<std::vector<SweepPoint>>;

// Same sweep, but a failed point leaves an empty slot instead.
auto RenderVariationSweepWithFallback(JobSpec const& templateJob,
                                      std::vector<VariationCoords> const& coordSets,
                                      RenderContext& context,
                                      SweepOptions const& options = {}) -> std::vector<std::optional<SweepPoint>>;

} // namespace PrimeGlyph
