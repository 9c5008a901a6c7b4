#pragma once

#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace PrimeGlyphTest {

inline auto default_font_dirs() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> dirs;
#if defined(__APPLE__)
  dirs.emplace_back("/System/Library/Fonts");
  dirs.emplace_back("/Library/Fonts");
#else
  dirs.emplace_back("/usr/share/fonts");
  dirs.emplace_back("/usr/local/share/fonts");
  if (auto* home = std::getenv("HOME")) {
    dirs.emplace_back(std::filesystem::path(home) / ".local/share/fonts");
    dirs.emplace_back(std::filesystem::path(home) / ".fonts");
  }
#endif
  return dirs;
}

inline auto to_lower(std::string text) -> std::string {
  for (char& c : text) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return text;
}

// PRIMEGLYPH_TEST_FONT wins; otherwise the first .ttf/.otf under the usual
// system font directories.
inline auto find_system_font_file() -> std::optional<std::filesystem::path> {
  if (auto* env = std::getenv("PRIMEGLYPH_TEST_FONT")) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(env, ec)) return std::filesystem::path(env);
  }
  for (auto const& dir : default_font_dirs()) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) continue;
    for (auto const& entry : std::filesystem::recursive_directory_iterator(dir, ec)) {
      if (ec) break;
      if (!entry.is_regular_file()) continue;
      auto ext = to_lower(entry.path().extension().string());
      if (ext == ".ttf" || ext == ".otf") {
        return entry.path();
      }
    }
  }
  return std::nullopt;
}

inline auto make_job(std::string id,
                     std::string fontPath,
                     std::string text = "Hello",
                     PrimeGlyph::RenderFormat format = PrimeGlyph::RenderFormat::Metrics,
                     int32_t width = 128,
                     int32_t height = 64) -> PrimeGlyph::JobSpec {
  PrimeGlyph::JobSpec job;
  job.id = std::move(id);
  job.font.path = std::move(fontPath);
  job.font.size = 32.0f;
  job.text.content = std::move(text);
  job.rendering.format = format;
  job.rendering.width = width;
  job.rendering.height = height;
  return job;
}

inline auto test_config() -> PrimeGlyph::EngineConfig {
  PrimeGlyph::EngineConfig config;
  config.workerCount = 4;
  config.logLevel = "warn";
  return config;
}

// Scratch directory removed on scope exit.
class TempDir {
public:
  explicit TempDir(std::string const& name) {
    root = std::filesystem::temp_directory_path() /
            ("primeglyph_" + name + "_" + std::to_string(std::rand()));
    std::filesystem::create_directories(root);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }
  auto path() const -> std::filesystem::path const& { return root; }

private:
  std::filesystem::path root;
};

} // namespace PrimeGlyphTest
