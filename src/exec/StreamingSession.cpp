#include "PrimeGlyph/exec/StreamingSession.hpp"
#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/cache/GlyphCache.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/job/JobParser.hpp"
#include "PrimeGlyph/render/RenderPipeline.hpp"

namespace PrimeGlyph {

struct StreamingSession::State {
  EngineConfig config;
  FontCache fonts;
  GlyphCache glyphs;

  explicit State(EngineConfig const& cfg)
    : config(cfg),
      fonts(cfg.fontCacheCapacity),
      glyphs(cfg.glyphCacheCapacity) {}

  auto context() -> RenderContext { return RenderContext{fonts, glyphs, config}; }
};

StreamingSession::StreamingSession(EngineConfig cfg)
  : config(std::move(cfg)),
    state(std::make_shared<State>(config)) {
  Log().info("Streaming session opened (font cache {}, glyph cache {})",
             config.fontCacheCapacity, config.glyphCacheCapacity);
}

StreamingSession::~StreamingSession() {
  close();
}

auto StreamingSession::acquire(Error* error) const -> std::shared_ptr<State> {
  std::lock_guard<std::mutex> lock(mutex);
  if (!state) SetError(error, ErrorCode::SessionClosed, "Session is closed");
  return state;
}

auto StreamingSession::render(JobSpec const& job, Error* error) -> std::optional<JobResult> {
  auto current = acquire(error);
  if (!current) return std::nullopt;
  auto context = current->context();
  return RenderJob(job, context);
}

auto StreamingSession::renderJson(std::string_view line, Error* error) -> std::optional<std::string> {
  auto current = acquire(error);
  if (!current) return std::nullopt;
  JobSpec job = ParseJobJson(line);
  auto context = current->context();
  return ToJsonLine(RenderJob(job, context));
}

auto StreamingSession::renderToImage(ImageRequest const& request, Error* error) -> std::optional<CoverageImage> {
  auto current = acquire(error);
  if (!current) return std::nullopt;

  if (request.font.path.empty() || request.text.content.empty() || !(request.font.size > 0.0f)) {
    SetError(error, ErrorCode::InvalidRenderParams, "Invalid render parameters: font path, text and a positive size are required");
    return std::nullopt;
  }
  JobSpec job;
  job.id = "image";
  job.font = request.font;
  job.text = request.text;
  job.rendering.width = request.width;
  job.rendering.height = request.height;

  std::string message;
  auto context = current->context();
  auto image = RenderCoverage(job, context, message);
  if (!image) {
    SetError(error, ErrorCode::InvalidRenderParams, message);
    return std::nullopt;
  }
  return *image;
}

auto StreamingSession::renderVariationSweep(JobSpec const& templateJob,
                                            std::vector<VariationCoords> const& coordSets,
                                            Error* error) -> std::optional<std::vector<SweepPoint>> {
  auto current = acquire(error);
  if (!current) return std::nullopt;
  auto context = current->context();
  return RenderVariationSweep(templateJob, coordSets, context, SweepOptions{}, error);
}

bool StreamingSession::warmUp(std::optional<std::string> fontPath) {
  auto current = acquire(nullptr);
  if (!current) return false;
  current->fonts.stats();
  current->glyphs.stats();
  if (!fontPath) return true;

  JobSpec job;
  job.id = "warmup";
  job.font.path = *fontPath;
  job.font.size = 16.0f;
  job.text.content = "a";
  job.rendering.format = RenderFormat::Metrics;
  job.rendering.width = 32;
  job.rendering.height = 32;
  auto context = current->context();
  JobResult result = RenderJob(job, context);
  if (!result.ok()) {
    Log().warn("Warm-up render with {} failed: {}", *fontPath, result.error.value_or(""));
  }
  return result.ok();
}

bool StreamingSession::ping() const {
  return true;
}

bool StreamingSession::setCacheSize(size_t capacity) {
  auto current = acquire(nullptr);
  if (!current) return false;
  current->fonts.setCapacity(capacity);
  return true;
}

bool StreamingSession::setGlyphCacheSize(size_t capacity) {
  auto current = acquire(nullptr);
  if (!current) return false;
  current->glyphs.setCapacity(capacity);
  return true;
}

auto StreamingSession::cacheStats() const -> CacheStats {
  CacheStats stats;
  auto current = acquire(nullptr);
  if (!current) return stats;
  stats.font = current->fonts.stats();
  stats.glyph = current->glyphs.stats();
  return stats;
}

void StreamingSession::close() {
  std::shared_ptr<State> released;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!state) return;
    released = std::move(state);
  }
  released->glyphs.clear();
  released->fonts.clear();
  Log().info("Streaming session closed");
}

bool StreamingSession::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex);
  return !state;
}

} // namespace PrimeGlyph
