#pragma once

#include "PrimeGlyph/job/JobSpec.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace PrimeGlyph {

enum class JobStatus : uint8_t {
  Success = 0,
  Error,
};

struct Timing {
  double shapeMs = 0.0;
  double renderMs = 0.0;
  double totalMs = 0.0;
};

struct RenderingOutput {
  RenderFormat format = RenderFormat::Pgm;
  RenderEncoding encoding = RenderEncoding::Base64;
  int32_t width = 0;
  int32_t height = 0;
  // Base64 text of the image container.
  std::string data;
  // x, y, w, h of the non-zero coverage; all zero for a blank canvas.
  std::array<uint32_t, 4> actualBBox{};
};

struct MetricsOutput {
  double density = 0.0;
  double beam = 0.0;
};

struct FontMetadata {
  std::string path;
  VariationCoords variations;
};

struct JobResult {
  std::string id;
  JobStatus status = JobStatus::Error;
  Timing timing;
  std::optional<RenderingOutput> rendering;
  std::optional<MetricsOutput> metrics;
  std::optional<FontMetadata> font;
  std::optional<std::string> error;

  bool ok() const { return status == JobStatus::Success; }
};

auto ToString(JobStatus status) -> std::string_view;

auto ErrorResult(std::string id, std::string message, double totalMs = 0.0) -> JobResult;

auto ToJson(JobResult const& result) -> nlohmann::json;

// One compact JSON object, no trailing newline.
auto ToJsonLine(JobResult const& result) -> std::string;

} // namespace PrimeGlyph

inline auto PrimeGlyph::ToString(JobStatus status) -> std::string_view {
  switch (status) {
    case JobStatus::Success: return "success";
    case JobStatus::Error: return "error";
  }
  return "error";
}
