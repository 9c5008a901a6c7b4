#pragma once

#include "PrimeGlyph/cache/CacheStats.hpp"
#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Error.hpp"
#include "PrimeGlyph/job/JobResult.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace PrimeGlyph {

// Single-pass sequence of results in completion order. Owns the worker pool
// and the font and glyph caches of one batch. Destroying or cancelling the
// stream stops scheduling new jobs and waits for the running ones.
class ResultStream {
public:
  ~ResultStream();
  ResultStream(ResultStream&&) noexcept;
  ResultStream& operator=(ResultStream&&) noexcept;

  ResultStream(ResultStream const&) = delete;
  ResultStream& operator=(ResultStream const&) = delete;

  // Blocks for the next finished job; empty once every result was handed out
  // (or the stream was cancelled and drained).
  auto next() -> std::optional<JobResult>;

  void cancel();

  auto jobCount() const -> size_t;
  auto workerCount() const -> uint32_t;
  auto cacheStats() const -> CacheStats;

private:
  struct Impl;
  explicit ResultStream(std::unique_ptr<Impl> state);
  std::unique_ptr<Impl> impl;

  friend auto ProcessJobs(BatchSpec batch,
                          EngineConfig const& config,
                          Error* error) -> std::optional<ResultStream>;
};

// Starts every job of an already built batch. An unsupported version or an
// empty or oversized job list fails the call before any job runs; jobs that
// fail validation or rendering come back as error results.
auto ProcessJobs(BatchSpec batch,
                 EngineConfig const& config,
                 Error* error = nullptr) -> std::optional<ResultStream>;

// Parses the envelope first; a malformed batch fails here and no job runs.
auto ProcessBatchJson(std::string_view raw,
                      EngineConfig const& config,
                      Error* error = nullptr) -> std::optional<ResultStream>;

} // namespace PrimeGlyph
