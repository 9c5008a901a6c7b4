#include "PrimeGlyph/render/RenderPipeline.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/job/JobParser.hpp"
#include "PrimeGlyph/render/ImageEncode.hpp"
#include "PrimeGlyph/render/Metrics.hpp"
#include "PrimeGlyph/text/Rasterizer.hpp"
#include "PrimeGlyph/text/Shaper.hpp"
#include "PrimeGlyph/util/Base64.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>

namespace PrimeGlyph {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point from, Clock::time_point to) -> double {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

class Deadline {
public:
  Deadline(Clock::time_point start, uint32_t timeoutMs)
    : begin(start), limitMs(timeoutMs) {}

  // Message naming the stage when the budget is spent.
  auto check(char const* stage) const -> std::optional<std::string> {
    if (limitMs == 0) return std::nullopt;
    if (elapsed_ms(begin, Clock::now()) <= static_cast<double>(limitMs)) return std::nullopt;
    return "Timeout: job exceeded " + std::to_string(limitMs) + " ms during " + stage;
  }

private:
  Clock::time_point begin;
  uint32_t limitMs = 0;
};

struct StageTimes {
  Clock::time_point fontReady = Clock::now();
  double shapeMs = 0.0;
};

// Runs as a shared cache load, so it must not depend on the budget of the
// job that happens to trigger it.
auto build_entry(FontInstance& font,
                 JobSpec const& job,
                 RasterKind kind,
                 StageTimes& times,
                 std::string& error) -> std::shared_ptr<GlyphEntry const> {
  auto shapeStart = Clock::now();
  auto shaped = ShapeText(font, job.text, job.font.size, error);
  times.shapeMs = elapsed_ms(shapeStart, Clock::now());
  if (!shaped) return nullptr;

  auto canvas = RasterizeRun(font,
                             *shaped,
                             static_cast<uint32_t>(job.rendering.width),
                             static_cast<uint32_t>(job.rendering.height),
                             error);
  if (!canvas) return nullptr;

  auto entry = std::make_shared<GlyphEntry>();
  entry->density = Density(*canvas);
  entry->beam = Beam(*canvas);
  entry->bbox = BoundingBox(*canvas);
  if (kind == RasterKind::Coverage) {
    entry->image = std::make_shared<CoverageImage const>(std::move(*canvas));
  }
  return entry;
}

struct EntryLookup {
  std::shared_ptr<FontInstance> font;
  std::shared_ptr<GlyphEntry const> entry;
  std::string error;
};

auto lookup_entry(JobSpec const& job,
                  RenderContext& context,
                  RasterKind kind,
                  Deadline const& deadline,
                  StageTimes& times) -> EntryLookup {
  EntryLookup out;
  FontLookup font = context.fonts.acquire(job.font, context.config);
  if (!font) {
    out.error = font.error;
    return out;
  }
  out.font = font.font;
  times.fontReady = Clock::now();
  if (auto timeout = deadline.check("font loading")) {
    out.error = *timeout;
    return out;
  }

  GlyphKey key = MakeGlyphKey(out.font->key(), job);
  key.kind = kind;
  out.entry = context.glyphs.getOrLoad(key, [&](std::string& error) {
    return build_entry(*out.font, job, kind, times, error);
  }, &out.error);
  if (!out.entry) return out;
  if (auto timeout = deadline.check("shape and render")) {
    out.entry = nullptr;
    out.error = *timeout;
  }
  return out;
}

auto render_job(JobSpec const& job, RenderContext& context) -> JobResult {
  auto start = Clock::now();
  Deadline deadline(start, context.config.jobTimeoutMs);

  if (auto invalid = ValidateJob(job, context.config)) {
    return ErrorResult(job.id, *invalid, elapsed_ms(start, Clock::now()));
  }
  if (auto timeout = deadline.check("start")) {
    return ErrorResult(job.id, *timeout, elapsed_ms(start, Clock::now()));
  }

  bool metricsOnly = job.rendering.format == RenderFormat::Metrics;
  StageTimes times;
  EntryLookup lookup = lookup_entry(job, context,
                                    metricsOnly ? RasterKind::MetricsOnly : RasterKind::Coverage,
                                    deadline, times);

  std::optional<FontMetadata> fontInfo;
  if (lookup.font) {
    fontInfo = FontMetadata{lookup.font->path(), lookup.font->appliedVariations()};
  }
  auto fail = [&](std::string message) {
    JobResult result = ErrorResult(job.id, std::move(message), elapsed_ms(start, Clock::now()));
    result.font = fontInfo;
    return result;
  };
  if (!lookup.entry) return fail(lookup.error);

  JobResult result;
  result.id = job.id;
  result.status = JobStatus::Success;
  result.font = fontInfo;
  auto const& entry = *lookup.entry;

  if (metricsOnly) {
    result.metrics = MetricsOutput{entry.density, entry.beam};
  } else {
    if (!entry.image) return fail("Rendering error: cached entry has no pixels");
    std::vector<uint8_t> container;
    if (job.rendering.format == RenderFormat::Png) {
      auto png = EncodePng(*entry.image);
      if (!png) return fail("Rendering error: PNG encoding failed");
      container = std::move(*png);
    } else {
      container = EncodePgm(*entry.image);
    }
    RenderingOutput output;
    output.format = job.rendering.format;
    output.encoding = RenderEncoding::Base64;
    output.width = job.rendering.width;
    output.height = job.rendering.height;
    output.data = EncodeBase64(container);
    output.actualBBox = entry.bbox;
    result.rendering = std::move(output);
  }

  if (auto timeout = deadline.check("encoding")) return fail(*timeout);

  auto end = Clock::now();
  result.timing.shapeMs = times.shapeMs;
  result.timing.renderMs = std::max(0.0, elapsed_ms(times.fontReady, end) - times.shapeMs);
  result.timing.totalMs = elapsed_ms(start, end);
  return result;
}

} // namespace

auto GuardJob(std::string const& id, std::function<JobResult()> const& body) -> JobResult {
  try {
    return body();
  } catch (std::exception const& e) {
    return ErrorResult(id, std::string{"Rendering error: "} + e.what());
  } catch (...) {
    return ErrorResult(id, "Rendering error: unknown failure");
  }
}

auto RenderJob(JobSpec const& job, RenderContext& context) -> JobResult {
  JobResult result = GuardJob(job.id, [&]() { return render_job(job, context); });
  if (!result.ok()) {
    Log().debug("Job '{}' failed: {}", result.id, result.error.value_or(""));
  }
  return result;
}

auto RenderCoverage(JobSpec const& job,
                    RenderContext& context,
                    std::string& error) -> std::shared_ptr<CoverageImage const> {
  if (auto invalid = ValidateJob(job, context.config)) {
    error = *invalid;
    return nullptr;
  }
  StageTimes times;
  Deadline deadline(Clock::now(), context.config.jobTimeoutMs);
  EntryLookup lookup = lookup_entry(job, context, RasterKind::Coverage, deadline, times);
  if (!lookup.entry || !lookup.entry->image) {
    error = lookup.error.empty() ? std::string{"Rendering error: no pixels produced"} : lookup.error;
    return nullptr;
  }
  return lookup.entry->image;
}

} // namespace PrimeGlyph
