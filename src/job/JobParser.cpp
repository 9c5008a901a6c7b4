#include "PrimeGlyph/job/JobParser.hpp"
#include "PrimeGlyph/core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace PrimeGlyph {

namespace {

using nlohmann::json;

constexpr size_t MaxFeatures = 64;
constexpr size_t MaxLanguageLength = 32;

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

// C0 controls other than tab/newline/carriage return, DEL, and the UTF-8
// encoded C1 range U+0080..U+009F.
auto has_control_chars(std::string_view text) -> bool {
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x20u && c != '\t' && c != '\n' && c != '\r') return true;
    if (c == 0x7Fu) return true;
    if (c == 0xC2u && i + 1 < text.size()) {
      unsigned char next = static_cast<unsigned char>(text[i + 1]);
      if (next >= 0x80u && next <= 0x9Fu) return true;
    }
  }
  return false;
}

auto optional_string(json const& object, char const* key, std::string& problem) -> std::optional<std::string> {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return std::nullopt;
  if (!it->is_string()) {
    problem = std::string{key} + " must be a string";
    return std::nullopt;
  }
  return it->get<std::string>();
}

void parse_font(json const& value, JobSpec& job, std::string& problem) {
  if (!value.is_object()) {
    problem = "font must be an object";
    return;
  }
  auto path = value.find("path");
  if (path == value.end() || !path->is_string()) {
    problem = "missing font.path";
    return;
  }
  job.font.path = path->get<std::string>();

  auto size = value.find("size");
  if (size == value.end() || !size->is_number()) {
    problem = "font.size must be a number";
    return;
  }
  job.font.size = size->get<float>();

  if (auto face = value.find("face_index"); face != value.end() && !face->is_null()) {
    if (!face->is_number_integer() || face->get<int64_t>() < 0) {
      problem = "font.face_index must be a non-negative integer";
      return;
    }
    job.font.faceIndex = static_cast<uint32_t>(face->get<int64_t>());
  }

  if (auto vars = value.find("variations"); vars != value.end() && !vars->is_null()) {
    if (!vars->is_object()) {
      problem = "font.variations must be an object";
      return;
    }
    for (auto it = vars->begin(); it != vars->end(); ++it) {
      if (!it.value().is_number()) {
        problem = "font.variations['" + it.key() + "'] must be a number";
        return;
      }
      job.font.variations[it.key()] = it.value().get<float>();
    }
  }
}

void parse_text(json const& value, JobSpec& job, std::string& problem) {
  if (!value.is_object()) {
    problem = "text must be an object";
    return;
  }
  auto content = value.find("content");
  if (content == value.end() || !content->is_string()) {
    problem = "missing text.content";
    return;
  }
  job.text.content = content->get<std::string>();
  job.text.script = optional_string(value, "script", problem);
  if (!problem.empty()) return;
  job.text.direction = optional_string(value, "direction", problem);
  if (!problem.empty()) return;
  job.text.language = optional_string(value, "language", problem);
  if (!problem.empty()) return;

  if (auto features = value.find("features"); features != value.end() && !features->is_null()) {
    if (!features->is_array()) {
      problem = "text.features must be an array of strings";
      return;
    }
    for (auto const& feature : *features) {
      if (!feature.is_string()) {
        problem = "text.features must be an array of strings";
        return;
      }
      job.text.features.push_back(feature.get<std::string>());
    }
  }
}

void parse_rendering(json const& value, JobSpec& job, std::string& problem) {
  if (!value.is_object()) {
    problem = "rendering must be an object";
    return;
  }

  // Dimensions are read even when the format is broken.
  std::string dimensionProblem;
  auto read_dimension = [&](char const* key, int32_t& out) {
    auto it = value.find(key);
    if (it == value.end() || !it->is_number_integer()) {
      if (dimensionProblem.empty()) dimensionProblem = std::string{"rendering."} + key + " must be an integer";
      return;
    }
    int64_t v = it->get<int64_t>();
    v = std::clamp<int64_t>(v, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());
    out = static_cast<int32_t>(v);
  };
  read_dimension("width", job.rendering.width);
  read_dimension("height", job.rendering.height);

  auto format = value.find("format");
  if (format == value.end() || !format->is_string()) {
    problem = "missing rendering.format";
    return;
  }
  auto parsedFormat = ParseRenderFormat(format->get<std::string>());
  if (!parsedFormat) {
    problem = "Invalid output format '" + format->get<std::string>() + "', expected 'pgm', 'png', or 'metrics'";
    return;
  }
  job.rendering.format = *parsedFormat;

  if (auto encoding = value.find("encoding"); encoding != value.end() && !encoding->is_null()) {
    if (!encoding->is_string()) {
      problem = "rendering.encoding must be a string";
      return;
    }
    auto parsedEncoding = ParseRenderEncoding(encoding->get<std::string>());
    if (!parsedEncoding) {
      problem = "Invalid encoding '" + encoding->get<std::string>() + "', expected 'base64', 'json', or 'binary'";
      return;
    }
    job.rendering.encoding = *parsedEncoding;
  }
  problem = std::move(dimensionProblem);
}

auto canvas_problem(RenderRequest const& r, EngineConfig const& config) -> std::optional<std::string> {
  int64_t maxDim = static_cast<int64_t>(config.maxCanvasDimension);
  if (r.width > 0 && r.height > 0 && r.width <= maxDim && r.height <= maxDim) return std::nullopt;
  return "Invalid canvas dimensions " + std::to_string(r.width) + "x" + std::to_string(r.height) +
         " (each side must be within 1-" + std::to_string(config.maxCanvasDimension) + ")";
}

void reject_batch(Error* error, ErrorCode code, std::string message) {
  Log().error("Rejecting batch ({}): {}", ToString(code), message);
  SetError(error, code, std::move(message));
}

auto check_version(std::string const& version, Error* error) -> bool {
  if (version == SupportedBatchVersion) return true;
  std::string shown = version.empty() ? std::string{"<missing>"} : version;
  reject_batch(error, ErrorCode::UnsupportedVersion,
               "Unsupported API version '" + shown + "', expected '" + std::string{SupportedBatchVersion} + "'");
  return false;
}

auto check_job_count(size_t count, EngineConfig const& config, Error* error) -> bool {
  if (count == 0) {
    reject_batch(error, ErrorCode::EmptyBatch, "Jobs array is empty");
    return false;
  }
  if (count > config.maxJobsPerBatch) {
    reject_batch(error, ErrorCode::TooManyJobs,
                 "Too many jobs in batch: " + std::to_string(count) +
                 " (max: " + std::to_string(config.maxJobsPerBatch) + ")");
    return false;
  }
  return true;
}

} // namespace

auto ParseJob(json const& value) -> JobSpec {
  JobSpec job;
  std::string problem;
  if (!value.is_object()) {
    job.structuralError = "Invalid job: job entry must be an object";
    return job;
  }

  if (auto id = value.find("id"); id != value.end() && id->is_string()) {
    job.id = id->get<std::string>();
  } else {
    problem = "missing id";
  }

  // Every section is parsed; the first problem found is the one reported.
  auto section = [&](char const* key, auto&& parser) {
    std::string sectionProblem;
    if (auto it = value.find(key); it != value.end()) {
      parser(*it, job, sectionProblem);
    } else {
      sectionProblem = std::string{"missing "} + key;
    }
    if (problem.empty()) problem = std::move(sectionProblem);
  };
  section("font", parse_font);
  section("text", parse_text);
  section("rendering", parse_rendering);

  if (!problem.empty()) {
    job.structuralError = "Invalid job: " + problem;
  }
  return job;
}

auto ParseJobJson(std::string_view raw) -> JobSpec {
  json value = json::parse(raw.begin(), raw.end(), nullptr, false);
  if (value.is_discarded()) {
    JobSpec job;
    job.structuralError = "Invalid job: malformed JSON";
    return job;
  }
  return ParseJob(value);
}

auto ParseBatch(std::string_view raw,
                EngineConfig const& config,
                Error* error) -> std::optional<BatchSpec> {
  auto reject = [&](ErrorCode code, std::string message) -> std::optional<BatchSpec> {
    reject_batch(error, code, std::move(message));
    return std::nullopt;
  };

  if (raw.size() > config.maxJsonBytes) {
    return reject(ErrorCode::InvalidInput,
                  "JSON input too large: " + std::to_string(raw.size()) +
                  " bytes (max: " + std::to_string(config.maxJsonBytes) + " bytes)");
  }

  json root = json::parse(raw.begin(), raw.end(), nullptr, false);
  if (root.is_discarded()) {
    return reject(ErrorCode::InvalidInput, "Invalid input: batch is not well-formed JSON");
  }
  if (!root.is_object()) {
    return reject(ErrorCode::InvalidInput, "Invalid input: batch must be a JSON object");
  }

  BatchSpec batch;
  auto version = root.find("version");
  if (version != root.end() && version->is_string()) {
    batch.version = version->get<std::string>();
  }
  if (!check_version(batch.version, error)) return std::nullopt;

  auto jobs = root.find("jobs");
  if (jobs == root.end() || !jobs->is_array()) {
    return reject(ErrorCode::InvalidInput, "Invalid input: 'jobs' must be an array");
  }
  if (!check_job_count(jobs->size(), config, error)) return std::nullopt;

  batch.jobs.reserve(jobs->size());
  for (auto const& entry : *jobs) {
    batch.jobs.push_back(ParseJob(entry));
  }
  return batch;
}

auto ValidateBatch(BatchSpec const& batch, EngineConfig const& config, Error* error) -> bool {
  return check_version(batch.version, error) && check_job_count(batch.jobs.size(), config, error);
}

auto ValidateJob(JobSpec const& job, EngineConfig const& config) -> std::optional<std::string> {
  auto canvas = canvas_problem(job.rendering, config);
  if (!job.structuralError.empty()) {
    // A bad canvas is still named next to the other structural problem.
    if (canvas) return job.structuralError + "; " + *canvas;
    return job.structuralError;
  }
  if (job.id.empty()) return std::string{"Invalid job: job id is empty"};
  if (canvas) return canvas;

  if (job.font.path.empty()) return std::string{"Invalid job: font.path is empty"};
  if (!std::isfinite(job.font.size) || job.font.size <= 0.0f || job.font.size > config.maxFontSize) {
    return "Invalid job: font size " + std::to_string(job.font.size) + " out of bounds (must be > 0 and <= " +
           std::to_string(static_cast<int>(config.maxFontSize)) + ")";
  }
  for (auto const& [axis, value] : job.font.variations) {
    if (!std::isfinite(value)) return "Invalid job: variation '" + axis + "' is not finite";
  }

  auto const& text = job.text.content;
  if (text.empty()) return std::string{"Invalid job: text content is empty"};
  if (text.size() > config.maxTextBytes) {
    return "Invalid job: text content too long (" + std::to_string(text.size()) + " bytes, max " +
           std::to_string(config.maxTextBytes) + ")";
  }
  if (has_control_chars(text)) return std::string{"Invalid job: text contains invalid control characters"};

  if (job.text.direction) {
    auto dir = to_lower(*job.text.direction);
    if (dir != "ltr" && dir != "rtl" && dir != "ttb" && dir != "btt") {
      return "Invalid job: unsupported text direction '" + *job.text.direction + "', expected ltr/rtl/ttb/btt";
    }
  }
  if (job.text.language) {
    auto const& language = *job.text.language;
    if (language.size() > MaxLanguageLength) {
      return "Invalid job: language tag '" + language + "' is too long";
    }
    bool valid = std::all_of(language.begin(), language.end(), [](unsigned char c) {
      return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!valid) return "Invalid job: language tag '" + language + "' contains invalid characters";
  }
  if (job.text.features.size() > MaxFeatures) {
    return "Invalid job: too many OpenType features supplied (" + std::to_string(job.text.features.size()) +
           " > " + std::to_string(MaxFeatures) + ")";
  }
  for (auto const& feature : job.text.features) {
    if (trim(feature).empty()) return std::string{"Invalid job: OpenType feature entries must be non-empty"};
  }
  return std::nullopt;
}

auto ToJson(JobSpec const& job) -> json {
  json font = {{"path", job.font.path}, {"size", job.font.size}};
  if (job.font.faceIndex != 0) font["face_index"] = job.font.faceIndex;
  if (!job.font.variations.empty()) {
    json variations = json::object();
    for (auto const& [axis, value] : job.font.variations) variations[axis] = value;
    font["variations"] = std::move(variations);
  }

  json text = {{"content", job.text.content}};
  if (job.text.script) text["script"] = *job.text.script;
  if (job.text.direction) text["direction"] = *job.text.direction;
  if (job.text.language) text["language"] = *job.text.language;
  if (!job.text.features.empty()) text["features"] = job.text.features;

  return {
    {"id", job.id},
    {"font", std::move(font)},
    {"text", std::move(text)},
    {"rendering", {
      {"format", std::string{ToString(job.rendering.format)}},
      {"encoding", std::string{ToString(job.rendering.encoding)}},
      {"width", job.rendering.width},
      {"height", job.rendering.height},
    }},
  };
}

} // namespace PrimeGlyph
