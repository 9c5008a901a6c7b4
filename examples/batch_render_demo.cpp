#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/exec/BatchExecutor.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace PrimeGlyphDemo {

bool read_input(std::string const& path, std::string& out) {
  if (path.empty() || path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return static_cast<bool>(std::cin) || std::cin.eof();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

} // namespace PrimeGlyphDemo

int main(int argc, char** argv) {
  using namespace PrimeGlyph;
  using namespace PrimeGlyphDemo;

  std::string inputPath;
  EngineConfig config = LoadConfigFromEnv();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--workers" && i + 1 < argc) {
      config.workerCount = static_cast<uint32_t>(std::max(0, std::atoi(argv[++i])));
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      config.jobTimeoutMs = static_cast<uint32_t>(std::max(0, std::atoi(argv[++i])));
    } else if (arg == "--base-dir" && i + 1 < argc) {
      config.baseDir = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      config.logLevel = argv[++i];
    } else {
      inputPath = arg;
    }
  }
  InitLogging(config);

  std::string raw;
  if (!read_input(inputPath, raw)) {
    Log().error("Cannot read batch input '{}'", inputPath);
    return 2;
  }

  Error error;
  auto stream = ProcessBatchJson(raw, config, &error);
  if (!stream) {
    std::cerr << ToString(error.code) << ": " << error.message << "\n";
    return 1;
  }

  size_t failures = 0;
  while (auto result = stream->next()) {
    if (!result->ok()) ++failures;
    std::cout << ToJsonLine(*result) << "\n";
  }
  std::cout.flush();

  auto stats = stream->cacheStats();
  Log().info("Done: {} jobs, {} failed, font cache {}/{} hits/misses, glyph cache {}/{}",
             stream->jobCount(), failures,
             stats.font.hits, stats.font.misses,
             stats.glyph.hits, stats.glyph.misses);
  return 0;
}
