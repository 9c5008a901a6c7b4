#include "PrimeGlyph/cache/FontCache.hpp"
#include "PrimeGlyph/core/Log.hpp"
#include "PrimeGlyph/util/Hash.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_MULTIPLE_MASTERS_H
#include <hb.h>
#include <hb-ft.h>

namespace PrimeGlyph {

class FontLibrary {
public:
  FontLibrary() {
    if (FT_Init_FreeType(&handle) != 0) {
      handle = nullptr;
      Log().error("FreeType initialization failed");
    }
  }
  ~FontLibrary() {
    if (handle) FT_Done_FreeType(handle);
  }

  FontLibrary(FontLibrary const&) = delete;
  FontLibrary& operator=(FontLibrary const&) = delete;

  FT_Library handle = nullptr;
  std::mutex mutex;
};

namespace {

auto tag_to_string(FT_ULong tag) -> std::string {
  std::string out(4, ' ');
  out[0] = static_cast<char>((tag >> 24) & 0xFF);
  out[1] = static_cast<char>((tag >> 16) & 0xFF);
  out[2] = static_cast<char>((tag >> 8) & 0xFF);
  out[3] = static_cast<char>(tag & 0xFF);
  return out;
}

void select_unicode_charmap(FT_Face face) {
  if (!face) return;
  if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == 0) return;
  for (int i = 0; i < face->num_charmaps; ++i) {
    if (face->charmaps[i] && face->charmaps[i]->encoding == FT_ENCODING_UNICODE) {
      FT_Set_Charmap(face, face->charmaps[i]);
      break;
    }
  }
}

// Picks the strike closest to sizePx for bitmap-only faces.
bool select_fixed_size(FT_Face face, float sizePx) {
  if (face->num_fixed_sizes <= 0) return false;
  int bestIndex = -1;
  float bestDiff = std::numeric_limits<float>::max();
  for (int i = 0; i < face->num_fixed_sizes; ++i) {
    FT_Bitmap_Size const& size = face->available_sizes[i];
    float ppem = size.y_ppem > 0 ? static_cast<float>(size.y_ppem) / 64.0f : static_cast<float>(size.height);
    float diff = std::abs(ppem - sizePx);
    if (diff < bestDiff) {
      bestDiff = diff;
      bestIndex = i;
    }
  }
  return bestIndex >= 0 && FT_Select_Size(face, bestIndex) == 0;
}

auto read_axes(FT_Library library, FT_Face face) -> std::vector<VariationAxis> {
  std::vector<VariationAxis> out;
  if (!FT_HAS_MULTIPLE_MASTERS(face)) return out;
  FT_MM_Var* mm = nullptr;
  if (FT_Get_MM_Var(face, &mm) != 0 || !mm) return out;
  out.reserve(mm->num_axis);
  for (FT_UInt i = 0; i < mm->num_axis; ++i) {
    FT_Var_Axis const& axis = mm->axis[i];
    VariationAxis entry;
    entry.tag = tag_to_string(axis.tag);
    entry.minValue = static_cast<float>(axis.minimum) / 65536.0f;
    entry.defaultValue = static_cast<float>(axis.def) / 65536.0f;
    entry.maxValue = static_cast<float>(axis.maximum) / 65536.0f;
    out.push_back(std::move(entry));
  }
  FT_Done_MM_Var(library, mm);
  return out;
}

bool apply_design_coordinates(FT_Face face,
                              std::vector<VariationAxis> const& axes,
                              VariationCoords const& coords) {
  if (axes.empty()) return coords.empty();
  std::vector<FT_Fixed> design(axes.size());
  for (size_t i = 0; i < axes.size(); ++i) {
    float value = axes[i].defaultValue;
    if (auto it = coords.find(axes[i].tag); it != coords.end()) value = it->second;
    design[i] = static_cast<FT_Fixed>(std::lround(value * 65536.0f));
  }
  return FT_Set_Var_Design_Coordinates(face, static_cast<FT_UInt>(design.size()), design.data()) == 0;
}

auto hard_axis_limits(std::string_view tag) -> std::optional<std::pair<float, float>> {
  if (tag == "wght") return std::pair{100.0f, 900.0f};
  if (tag == "wdth") return std::pair{50.0f, 200.0f};
  return std::nullopt;
}

} // namespace

size_t FontKeyHash::operator()(FontKey const& key) const {
  uint64_t h = fnv1a_hash(HashSeed, key.path);
  h = fnv1a_hash(h, static_cast<uint64_t>(key.faceIndex));
  for (auto const& [axis, value] : key.variations) {
    h = fnv1a_hash(h, axis);
    h = fnv1a_hash(h, value);
  }
  return static_cast<size_t>(h);
}

FontInstance::~FontInstance() {
  if (!library) return;
  std::lock_guard<std::mutex> lock(library->mutex);
  // hb_ft_font_create_referenced holds its own face reference.
  if (hbFontHandle) hb_font_destroy(hbFontHandle);
  if (ftFace) FT_Done_Face(ftFace);
}

bool FontInstance::applySize(float sizePx) const {
  if (!ftFace || !(sizePx > 0.0f)) return false;
  if (currentSize == sizePx) return true;
  bool sized = false;
  if (scalable) {
    auto charSize = static_cast<FT_F26Dot6>(std::lround(sizePx * 64.0f));
    sized = FT_Set_Char_Size(ftFace, 0, std::max<FT_F26Dot6>(charSize, 1), 72, 72) == 0;
  } else {
    sized = select_fixed_size(ftFace, sizePx);
  }
  if (!sized) {
    currentSize = 0.0f;
    return false;
  }
  hb_ft_font_changed(hbFontHandle);
  currentSize = sizePx;
  return true;
}

namespace {

auto read_font_file(std::string const& path, size_t maxFileBytes, std::string& error) -> FontBytes {
  std::error_code ec;
  auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "Font error: cannot read font file '" + path + "': " + ec.message();
    return nullptr;
  }
  if (fileSize > maxFileBytes) {
    error = "Font error: font file '" + path + "' is too large (" + std::to_string(fileSize) +
            " bytes, max " + std::to_string(maxFileBytes) + ")";
    return nullptr;
  }

  auto data = std::make_shared<std::vector<uint8_t>>(static_cast<size_t>(fileSize));
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open() ||
      !file.read(reinterpret_cast<char*>(data->data()), static_cast<std::streamsize>(fileSize))) {
    error = "Font error: failed to read font file '" + path + "'";
    return nullptr;
  }
  return data;
}

} // namespace

auto FontInstance::Load(std::shared_ptr<FontLibrary> library,
                        FontKey key,
                        size_t maxFileBytes,
                        FontBytes fileData,
                        std::string& error) -> std::shared_ptr<FontInstance> {
  if (!library || !library->handle) {
    error = "Font error: font engine is not available";
    return nullptr;
  }
  if (!fileData) {
    fileData = read_font_file(key.path, maxFileBytes, error);
    if (!fileData) return nullptr;
  }

  auto instance = std::make_shared<FontInstance>(Token{});
  instance->bytes = std::move(fileData);
  instance->library = library;
  instance->identity = std::move(key);
  auto const& id = instance->identity;

  FT_Face face = nullptr;
  FT_Error status = 0;
  {
    std::lock_guard<std::mutex> lock(library->mutex);
    status = FT_New_Memory_Face(library->handle,
                                reinterpret_cast<const FT_Byte*>(instance->bytes->data()),
                                static_cast<FT_Long>(instance->bytes->size()),
                                static_cast<FT_Long>(id.faceIndex),
                                &face);
  }
  if (status != 0 || !face) {
    error = "Font error: failed to parse font '" + id.path + "' (face index " +
            std::to_string(id.faceIndex) + ")";
    return nullptr;
  }
  instance->ftFace = face;

  select_unicode_charmap(face);
  instance->axisList = read_axes(library->handle, face);
  if (!id.variations.empty() && !apply_design_coordinates(face, instance->axisList, id.variations)) {
    error = "Font error: failed to apply variation coordinates to '" + id.path + "'";
    return nullptr;
  }
  instance->upem = face->units_per_EM;
  instance->scalable = FT_IS_SCALABLE(face);

  {
    std::lock_guard<std::mutex> lock(library->mutex);
    instance->hbFontHandle = hb_ft_font_create_referenced(face);
  }
  if (!id.variations.empty()) {
    std::vector<hb_variation_t> variations;
    variations.reserve(id.variations.size());
    for (auto const& [axis, value] : id.variations) {
      hb_variation_t variation;
      variation.tag = hb_tag_from_string(axis.data(), static_cast<int>(axis.size()));
      variation.value = value;
      variations.push_back(variation);
    }
    hb_font_set_variations(instance->hbFontHandle, variations.data(), static_cast<unsigned>(variations.size()));
  }
  return instance;
}

auto ResolveFontPath(std::string_view path,
                     std::string_view baseDir,
                     std::string& error) -> std::optional<std::string> {
  namespace fs = std::filesystem;
  if (path.empty()) {
    error = "Font error: font path is empty";
    return std::nullopt;
  }

  std::error_code ec;
  fs::path requested{std::string{path}};
  if (!baseDir.empty()) {
    if (path.find("..") != std::string_view::npos || path.find('~') != std::string_view::npos) {
      Log().warn("Refusing font path with traversal characters: {}", path);
      error = "Font error: path '" + std::string{path} + "' contains invalid characters (.. or ~)";
      return std::nullopt;
    }
    if (requested.is_relative()) requested = fs::path{std::string{baseDir}} / requested;
  }

  fs::path canonical = fs::canonical(requested, ec);
  if (ec) {
    error = "Font error: cannot resolve font path '" + std::string{path} + "': " + ec.message();
    return std::nullopt;
  }

  if (!baseDir.empty()) {
    fs::path base = fs::canonical(fs::path{std::string{baseDir}}, ec);
    if (ec) {
      error = "Font error: cannot resolve base directory '" + std::string{baseDir} + "': " + ec.message();
      return std::nullopt;
    }
    auto mismatch = std::mismatch(base.begin(), base.end(), canonical.begin(), canonical.end());
    if (mismatch.first != base.end()) {
      Log().warn("Font path {} is outside base directory {}", canonical.string(), base.string());
      error = "Font error: path '" + std::string{path} + "' is outside the allowed directory";
      return std::nullopt;
    }
  }
  return canonical.string();
}

auto SanitizeVariations(std::vector<VariationAxis> const& axes,
                        VariationCoords const& requested) -> VariationCoords {
  VariationCoords applied;
  for (auto const& [tag, value] : requested) {
    auto axis = std::find_if(axes.begin(), axes.end(), [&](VariationAxis const& a) { return a.tag == tag; });
    if (axis == axes.end()) {
      Log().warn("Dropping variation '{}'={}: axis not present in font", tag, value);
      continue;
    }
    float lo = axis->minValue;
    float hi = axis->maxValue;
    if (auto hard = hard_axis_limits(tag)) {
      float hardLo = std::max(lo, hard->first);
      float hardHi = std::min(hi, hard->second);
      if (hardLo <= hardHi) {
        lo = hardLo;
        hi = hardHi;
      }
    }
    float clamped = std::clamp(value, lo, hi);
    if (std::abs(clamped - value) > 0.001f) {
      Log().warn("Clamped variation '{}' from {} to {} (bounds [{}, {}])", tag, value, clamped, lo, hi);
    }
    applied[tag] = clamped;
  }
  return applied;
}

FontCache::FontCache(size_t capacity)
  : library(std::make_shared<FontLibrary>()),
    cache(capacity) {
  cache.setEvictionListener([](FontKey const& key) {
    Log().debug("Evicted font {} (face {}, {} coords)", key.path, key.faceIndex, key.variations.size());
  });
}

FontCache::~FontCache() = default;

auto FontCache::load(FontKey const& key, size_t maxFileBytes, FontBytes fileData) -> FontLookup {
  FontLookup lookup;
  lookup.font = cache.getOrLoad(key, [&](std::string& error) {
    auto font = FontInstance::Load(library, key, maxFileBytes, fileData, error);
    if (font) {
      Log().debug("Loaded font {} (face {}, {} axes)", key.path, key.faceIndex, font->axes().size());
    }
    return font;
  }, &lookup.error);
  return lookup;
}

auto FontCache::acquire(FontRef const& ref, EngineConfig const& config) -> FontLookup {
  FontLookup lookup;
  auto canonical = ResolveFontPath(ref.path, config.baseDir, lookup.error);
  if (!canonical) return lookup;

  FontKey baseKey{*canonical, ref.faceIndex, {}};
  FontLookup base = load(baseKey, config.maxFontFileBytes, nullptr);
  if (!base || ref.variations.empty()) return base;

  VariationCoords applied = SanitizeVariations(base.font->axes(), ref.variations);
  if (applied.empty()) return base;
  // Instances of the same file share the base instance's bytes.
  return load(FontKey{*canonical, ref.faceIndex, std::move(applied)}, config.maxFontFileBytes,
              base.font->fileData());
}

} // namespace PrimeGlyph
