#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace PrimeGlyph {

// Call-level failures. Job-local failures never use this type; they travel
// inside JobResult::error instead.
enum class ErrorCode : uint8_t {
  None = 0,
  InvalidInput,
  UnsupportedVersion,
  EmptyBatch,
  TooManyJobs,
  SessionClosed,
  InvalidRenderParams,
  RenderFailed,
};

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}

  explicit operator bool() const { return code != ErrorCode::None; }
};

auto ToString(ErrorCode code) -> std::string_view;

// Writes into an optional out-parameter.
inline void SetError(Error* out, ErrorCode code, std::string message) {
  if (!out) return;
  out->code = code;
  out->message = std::move(message);
}

} // namespace PrimeGlyph

inline auto PrimeGlyph::ToString(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::InvalidInput: return "invalid_input";
    case ErrorCode::UnsupportedVersion: return "unsupported_version";
    case ErrorCode::EmptyBatch: return "empty_batch";
    case ErrorCode::TooManyJobs: return "too_many_jobs";
    case ErrorCode::SessionClosed: return "session_closed";
    case ErrorCode::InvalidRenderParams: return "invalid_render_params";
    case ErrorCode::RenderFailed: return "render_failed";
  }
  return "none";
}
