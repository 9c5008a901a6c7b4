#include "PrimeGlyph/job/JobResult.hpp"

namespace PrimeGlyph {

auto ErrorResult(std::string id, std::string message, double totalMs) -> JobResult {
  JobResult result;
  result.id = std::move(id);
  result.status = JobStatus::Error;
  result.error = std::move(message);
  result.timing.totalMs = totalMs;
  return result;
}

auto ToJson(JobResult const& result) -> nlohmann::json {
  nlohmann::json out = nlohmann::json::object();
  out["id"] = result.id;
  out["status"] = std::string{ToString(result.status)};
  out["timing"] = {
    {"shape_ms", result.timing.shapeMs},
    {"render_ms", result.timing.renderMs},
    {"total_ms", result.timing.totalMs},
  };

  if (result.rendering) {
    auto const& r = *result.rendering;
    out["rendering"] = {
      {"format", std::string{ToString(r.format)}},
      {"encoding", "base64"},
      {"width", r.width},
      {"height", r.height},
      {"data", r.data},
      {"actual_bbox", {r.actualBBox[0], r.actualBBox[1], r.actualBBox[2], r.actualBBox[3]}},
    };
  }
  if (result.metrics) {
    out["metrics"] = {
      {"density", result.metrics->density},
      {"beam", result.metrics->beam},
    };
  }
  if (result.font) {
    nlohmann::json font = {{"path", result.font->path}};
    if (!result.font->variations.empty()) {
      nlohmann::json variations = nlohmann::json::object();
      for (auto const& [axis, value] : result.font->variations) {
        variations[axis] = value;
      }
      font["variations"] = std::move(variations);
    }
    out["font"] = std::move(font);
  }
  if (result.error) {
    out["error"] = *result.error;
  }
  return out;
}

auto ToJsonLine(JobResult const& result) -> std::string {
  // Replace invalid UTF-8 (e.g. echoed ids) instead of throwing.
  return ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace PrimeGlyph
