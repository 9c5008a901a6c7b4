#include "PrimeGlyph/exec/BatchExecutor.hpp"
#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/cache/GlyphCache.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/exec/ResultChannel.hpp"
#include "PrimeGlyph/exec/WorkerPool.hpp"
#include "PrimeGlyph/job/JobParser.hpp"
#include "PrimeGlyph/render/RenderPipeline.hpp"

#include <algorithm>
#include <atomic>

namespace PrimeGlyph {

struct ResultStream::Impl {
  EngineConfig config;
  std::vector<JobSpec> jobs;
  FontCache fonts;
  GlyphCache glyphs;
  ResultChannel<JobResult> channel;
  std::atomic<size_t> finished{0};
  WorkerPool pool;

  Impl(BatchSpec batch, EngineConfig const& cfg, uint32_t workers)
    : config(cfg),
      jobs(std::move(batch.jobs)),
      fonts(cfg.fontCacheCapacity),
      glyphs(cfg.glyphCacheCapacity),
      pool(workers) {}

  ~Impl() { stop(); }

  void begin() {
    pool.start(static_cast<uint32_t>(jobs.size()), [this](uint32_t index) { runJob(index); });
  }

  void runJob(uint32_t index) {
    RenderContext context{fonts, glyphs, config};
    channel.push(RenderJob(jobs[index], context));
    if (finished.fetch_add(1) + 1 == jobs.size()) {
      channel.close();
    }
  }

  void stop() {
    pool.cancel();
    pool.wait();
    channel.close();
  }
};

ResultStream::ResultStream(std::unique_ptr<Impl> state) : impl(std::move(state)) {}
ResultStream::~ResultStream() = default;
ResultStream::ResultStream(ResultStream&&) noexcept = default;
ResultStream& ResultStream::operator=(ResultStream&&) noexcept = default;

auto ResultStream::next() -> std::optional<JobResult> {
  if (!impl) return std::nullopt;
  return impl->channel.pop();
}

void ResultStream::cancel() {
  if (!impl) return;
  Log().info("Batch cancelled after {} of {} jobs", impl->finished.load(), impl->jobs.size());
  impl->stop();
}

auto ResultStream::jobCount() const -> size_t {
  return impl ? impl->jobs.size() : 0u;
}

auto ResultStream::workerCount() const -> uint32_t {
  return impl ? impl->pool.threadCount() : 0u;
}

auto ResultStream::cacheStats() const -> CacheStats {
  CacheStats stats;
  if (!impl) return stats;
  stats.font = impl->fonts.stats();
  stats.glyph = impl->glyphs.stats();
  return stats;
}

auto ProcessJobs(BatchSpec batch,
                 EngineConfig const& config,
                 Error* error) -> std::optional<ResultStream> {
  if (!ValidateBatch(batch, config, error)) return std::nullopt;

  size_t jobCount = batch.jobs.size();
  uint32_t workers = ResolveWorkerCount(config);
  workers = static_cast<uint32_t>(std::clamp<size_t>(jobCount, 1u, workers));
  Log().info("Processing batch: {} jobs on {} workers", jobCount, workers);

  auto state = std::make_unique<ResultStream::Impl>(std::move(batch), config, workers);
  state->begin();
  return ResultStream(std::move(state));
}

auto ProcessBatchJson(std::string_view raw,
                      EngineConfig const& config,
                      Error* error) -> std::optional<ResultStream> {
  auto batch = ParseBatch(raw, config, error);
  if (!batch) return std::nullopt;
  return ProcessJobs(std::move(*batch), config, error);
}

} // namespace PrimeGlyph
