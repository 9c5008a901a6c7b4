#include "PrimeGlyph/exec/VariationSweep.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/exec/WorkerPool.hpp"

#include <algorithm>

namespace PrimeGlyph {

namespace {

struct PointOutcome {
  std::optional<SweepPoint> point;
  std::string error;
};

auto sweep(JobSpec const& templateJob,
           std::vector<VariationCoords> const& coordSets,
           RenderContext& context,
           SweepOptions const& options) -> std::vector<PointOutcome> {
  std::vector<PointOutcome> outcomes(coordSets.size());
  if (coordSets.empty()) return outcomes;

  uint32_t workers = options.workerCount != 0 ? options.workerCount : ResolveWorkerCount(context.config);
  workers = static_cast<uint32_t>(std::clamp<size_t>(coordSets.size(), 1u, std::max(1u, workers)));
  Log().debug("Variation sweep: {} points on {} workers", coordSets.size(), workers);

  WorkerPool pool(workers);
  pool.run(static_cast<uint32_t>(coordSets.size()), [&](uint32_t index) {
    JobSpec job = templateJob;
    job.font.variations = coordSets[index];
    job.rendering.format = RenderFormat::Metrics;
    if (job.id.empty()) job.id = "sweep-" + std::to_string(index);
    JobResult result = RenderJob(job, context);
    auto& outcome = outcomes[index];
    if (!result.ok() || !result.metrics) {
      outcome.error = result.error.value_or("Rendering error: no metrics produced");
      return;
    }
    outcome.point = SweepPoint{coordSets[index], *result.metrics, result.timing.renderMs};
  });
  return outcomes;
}

} // namespace

auto RenderVariationSweep(JobSpec const& templateJob,
                          std::vector<VariationCoords> const& coordSets,
                          RenderContext& context,
                          SweepOptions const& options,
                          Error* error) -> std::optional<std::vector<SweepPoint>> {
  auto outcomes = sweep(templateJob, coordSets, context, options);
  std::vector<SweepPoint> points;
  points.reserve(outcomes.size());
  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].point) {
      SetError(error, ErrorCode::RenderFailed,
               "Variation sweep point " + std::to_string(i) + " failed: " + outcomes[i].error);
      return std::nullopt;
    }
    points.push_back(std::move(*outcomes[i].point));
  }
  return points;
}

auto RenderVariationSweepWithFallback(JobSpec const& templateJob,
                                      std::vector<VariationCoords> const& coordSets,
                                      RenderContext& context,
                                      SweepOptions const& options) -> std::vector<std::optional<SweepPoint>> {
  auto outcomes = sweep(templateJob, coordSets, context, options);
  std::vector<std::optional<SweepPoint>> points;
  points.reserve(outcomes.size());
  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].point) {
      Log().warn("Variation sweep point {} failed: {}", i, outcomes[i].error);
    }
    points.push_back(std::move(outcomes[i].point));
  }
  return points;
}

} // namespace PrimeGlyph
