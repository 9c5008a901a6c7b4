#pragma once

#include "PrimeGlyph/cache/CacheStats.hpp"
#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Error.hpp"
#include "PrimeGlyph/exec/VariationSweep.hpp"
#include "PrimeGlyph/job/JobResult.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"
#include "PrimeGlyph/render/CoverageImage.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PrimeGlyph {

struct ImageRequest {
  FontRef font;
  TextRun text;
  int32_t width = 0;
  int32_t height = 0;
};

// Long-lived owner of one font cache and one glyph cache. Every call is safe
// from concurrent callers. close() releases the caches; renders already in
// flight keep their share alive until they return.
class StreamingSession {
public:
  explicit StreamingSession(EngineConfig config = LoadConfigFromEnv());
  ~StreamingSession();

  StreamingSession(StreamingSession const&) = delete;
  StreamingSession& operator=(StreamingSession const&) = delete;

  // Job-local failures come back as error results; only a closed session
  // fails the call.
  auto render(JobSpec const& job, Error* error = nullptr) -> std::optional<JobResult>;

  // One job JSON object in, one result JSON line out.
  auto renderJson(std::string_view line, Error* error = nullptr) -> std::optional<std::string>;

  // Raw coverage canvas (height x width bytes). Any failure fails the call
  // with InvalidRenderParams.
  auto renderToImage(ImageRequest const& request, Error* error = nullptr) -> std::optional<CoverageImage>;

  auto renderVariationSweep(JobSpec const& templateJob,
                            std::vector<VariationCoords> const& coordSets,
                            Error* error = nullptr) -> std::optional<std::vector<SweepPoint>>;

  // Without a font only the caches are touched; with one a small throwaway
  // render must succeed.
  bool warmUp(std::optional<std::string> fontPath = std::nullopt);
  bool ping() const;

  bool setCacheSize(size_t capacity);
  bool setGlyphCacheSize(size_t capacity);
  auto cacheStats() const -> CacheStats;

  // Idempotent.
  void close();
  bool isClosed() const;

private:
  struct State;

  auto acquire(Error* error) const -> std::shared_ptr<State>;

  EngineConfig config;
  mutable std::mutex mutex;
  std::shared_ptr<State> state;
};

} // namespace PrimeGlyph
