#pragma once

#include "PrimeGlyph/cache/CacheStats.hpp"
#include "PrimeGlyph/cache/LruCache.hpp"
#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct FT_FaceRec_;
struct hb_font_t;

namespace PrimeGlyph {

// Shared FreeType library handle. Face creation and destruction go through
// its mutex; FT_Library is not thread-safe for those calls.
class FontLibrary;

struct FontKey {
  std::string path;
  uint32_t faceIndex = 0;
  VariationCoords variations;

  bool operator==(FontKey const& other) const {
    return faceIndex == other.faceIndex && path == other.path && variations == other.variations;
  }
};

struct FontKeyHash {
  size_t operator()(FontKey const& key) const;
};

// Raw font file contents. Every instance of one file shares a single copy.
using FontBytes = std::shared_ptr<std::vector<uint8_t> const>;

struct VariationAxis {
  std::string tag;
  float minValue = 0.0f;
  float defaultValue = 0.0f;
  float maxValue = 0.0f;
};

// One parsed face with its variation instance applied. Shaping and
// rasterization must hold lock() while touching face() or hbFont(); the pixel
// size is per-use state set under that lock.
class FontInstance {
  struct Token {
    explicit Token() = default;
  };

public:
  explicit FontInstance(Token) {}
  ~FontInstance();

  FontInstance(FontInstance const&) = delete;
  FontInstance& operator=(FontInstance const&) = delete;

  auto key() const -> FontKey const& { return identity; }
  auto path() const -> std::string const& { return identity.path; }
  auto appliedVariations() const -> VariationCoords const& { return identity.variations; }
  auto axes() const -> std::vector<VariationAxis> const& { return axisList; }
  auto unitsPerEm() const -> uint16_t { return upem; }
  bool isScalable() const { return scalable; }

  auto lock() const -> std::unique_lock<std::mutex> { return std::unique_lock<std::mutex>(mutex); }

  // Requires lock(). Returns false when the face cannot be sized.
  bool applySize(float sizePx) const;

  auto face() const -> FT_FaceRec_* { return ftFace; }
  auto hbFont() const -> hb_font_t* { return hbFontHandle; }
  auto fileData() const -> FontBytes const& { return bytes; }

  // Reads the file unless fileData already holds its contents.
  static auto Load(std::shared_ptr<FontLibrary> library,
                   FontKey key,
                   size_t maxFileBytes,
                   FontBytes fileData,
                   std::string& error) -> std::shared_ptr<FontInstance>;

private:
  std::shared_ptr<FontLibrary> library;
  FontKey identity;
  FontBytes bytes;
  FT_FaceRec_* ftFace = nullptr;
  hb_font_t* hbFontHandle = nullptr;
  std::vector<VariationAxis> axisList;
  uint16_t upem = 0;
  bool scalable = true;
  mutable float currentSize = 0.0f;
  mutable std::mutex mutex;
};

struct FontLookup {
  std::shared_ptr<FontInstance> font;
  std::string error;

  explicit operator bool() const { return static_cast<bool>(font); }
};

// Resolves a font path the way the cache identifies it: relative paths are
// anchored at baseDir, ".." and "~" are refused when baseDir is set, and the
// canonical result must stay inside baseDir. Returns the canonical path.
auto ResolveFontPath(std::string_view path,
                     std::string_view baseDir,
                     std::string& error) -> std::optional<std::string>;

// Clamps requested coordinates to the axes the face declares (and wght to
// [100, 900], wdth to [50, 200]). Unknown axes are dropped; a face without
// axes drops everything.
auto SanitizeVariations(std::vector<VariationAxis> const& axes,
                        VariationCoords const& requested) -> VariationCoords;

class FontCache {
public:
  explicit FontCache(size_t capacity);
  ~FontCache();

  FontCache(FontCache const&) = delete;
  FontCache& operator=(FontCache const&) = delete;

  auto acquire(FontRef const& ref, EngineConfig const& config) -> FontLookup;

  void setCapacity(size_t capacity) { cache.setCapacity(capacity); }
  auto capacity() const -> size_t { return cache.capacity(); }
  auto size() const -> size_t { return cache.size(); }
  void clear() { cache.clear(); }
  auto stats() const -> TierStats { return cache.stats(); }

private:
  auto load(FontKey const& key, size_t maxFileBytes, FontBytes fileData) -> FontLookup;

  std::shared_ptr<FontLibrary> library;
  LruCache<FontKey, FontInstance, FontKeyHash> cache;
};

} // namespace PrimeGlyph
