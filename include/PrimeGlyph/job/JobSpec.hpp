#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PrimeGlyph {

// Axis tag -> user-space coordinate. Ordered so equal maps serialize and hash
// identically.
using VariationCoords = std::map<std::string, float>;

struct FontRef {
  std::string path;
  // Pixels per em.
  float size = 0.0f;
  VariationCoords variations;
  uint32_t faceIndex = 0;
};

struct TextRun {
  std::string content;
  std::optional<std::string> script;
  // ltr, rtl, ttb or btt; HarfBuzz guesses when unset.
  std::optional<std::string> direction;
  std::optional<std::string> language;
  // Entries in HarfBuzz feature syntax ("liga=0", "kern", "+smcp").
  std::vector<std::string> features;
};

enum class RenderFormat : uint8_t {
  Pgm = 0,
  Png,
  Metrics,
};

enum class RenderEncoding : uint8_t {
  Base64 = 0,
  Json,
  Binary,
};

struct RenderRequest {
  RenderFormat format = RenderFormat::Pgm;
  RenderEncoding encoding = RenderEncoding::Base64;
  int32_t width = 0;
  int32_t height = 0;
};

struct JobSpec {
  std::string id;
  FontRef font;
  TextRun text;
  RenderRequest rendering;
  // Set by the parser when the job JSON is structurally broken. Such jobs are
  // reported as error results, never as batch failures.
  std::string structuralError;
};

struct BatchSpec {
  std::string version;
  std::vector<JobSpec> jobs;
};

inline constexpr std::string_view SupportedBatchVersion = "1.0";

auto ToString(RenderFormat format) -> std::string_view;
auto ToString(RenderEncoding encoding) -> std::string_view;
auto ParseRenderFormat(std::string_view text) -> std::optional<RenderFormat>;
auto ParseRenderEncoding(std::string_view text) -> std::optional<RenderEncoding>;

} // namespace PrimeGlyph

inline auto PrimeGlyph::ToString(RenderFormat format) -> std::string_view {
  switch (format) {
    case RenderFormat::Pgm: return "pgm";
    case RenderFormat::Png: return "png";
    case RenderFormat::Metrics: return "metrics";
  }
  return "pgm";
}

inline auto PrimeGlyph::ToString(RenderEncoding encoding) -> std::string_view {
  switch (encoding) {
    case RenderEncoding::Base64: return "base64";
    case RenderEncoding::Json: return "json";
    case RenderEncoding::Binary: return "binary";
  }
  return "base64";
}

inline auto PrimeGlyph::ParseRenderFormat(std::string_view text) -> std::optional<RenderFormat> {
  if (text == "pgm") return RenderFormat::Pgm;
  if (text == "png") return RenderFormat::Png;
  if (text == "metrics") return RenderFormat::Metrics;
  return std::nullopt;
}

inline auto PrimeGlyph::ParseRenderEncoding(std::string_view text) -> std::optional<RenderEncoding> {
  if (text == "base64") return RenderEncoding::Base64;
  if (text == "json") return RenderEncoding::Json;
  if (text == "binary") return RenderEncoding::Binary;
  return std::nullopt;
}
