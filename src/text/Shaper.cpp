#include "PrimeGlyph/text/Shaper.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <hb.h>

namespace PrimeGlyph {

namespace {

struct BufferDeleter {
  void operator()(hb_buffer_t* buffer) const { hb_buffer_destroy(buffer); }
};

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto parse_direction(std::string_view text) -> hb_direction_t {
  auto lowered = to_lower(text);
  if (lowered == "ltr") return HB_DIRECTION_LTR;
  if (lowered == "rtl") return HB_DIRECTION_RTL;
  if (lowered == "ttb") return HB_DIRECTION_TTB;
  if (lowered == "btt") return HB_DIRECTION_BTT;
  return HB_DIRECTION_INVALID;
}

auto parse_features(std::vector<std::string> const& features, std::string& error) -> std::optional<std::vector<hb_feature_t>> {
  std::vector<hb_feature_t> out;
  out.reserve(features.size());
  for (auto const& text : features) {
    hb_feature_t feature;
    if (!hb_feature_from_string(text.data(), static_cast<int>(text.size()), &feature)) {
      error = "Shaping error: invalid OpenType feature '" + text + "'";
      return std::nullopt;
    }
    out.push_back(feature);
  }
  return out;
}

} // namespace

auto ShapedRun::advanceWidth() const -> float {
  float width = 0.0f;
  for (auto const& glyph : glyphs) width += glyph.xAdvance;
  return width;
}

auto ShapeText(FontInstance& font,
               TextRun const& run,
               float sizePx,
               std::string& error) -> std::optional<ShapedRun> {
  if (run.content.empty()) {
    error = "Shaping error: text is empty";
    return std::nullopt;
  }
  auto features = parse_features(run.features, error);
  if (!features) return std::nullopt;

  std::unique_ptr<hb_buffer_t, BufferDeleter> buffer(hb_buffer_create());
  if (!hb_buffer_allocation_successful(buffer.get())) {
    error = "Shaping error: failed to allocate shaping buffer";
    return std::nullopt;
  }
  hb_buffer_add_utf8(buffer.get(), run.content.data(), static_cast<int>(run.content.size()), 0, -1);

  if (run.direction) {
    hb_direction_t direction = parse_direction(*run.direction);
    if (direction == HB_DIRECTION_INVALID) {
      error = "Shaping error: unsupported direction '" + *run.direction + "'";
      return std::nullopt;
    }
    hb_buffer_set_direction(buffer.get(), direction);
  }
  if (run.script) {
    hb_script_t script = hb_script_from_string(run.script->data(), static_cast<int>(run.script->size()));
    if (script == HB_SCRIPT_INVALID || script == HB_SCRIPT_UNKNOWN) {
      error = "Shaping error: unsupported script '" + *run.script + "'";
      return std::nullopt;
    }
    hb_buffer_set_script(buffer.get(), script);
  }
  if (run.language) {
    hb_language_t language = hb_language_from_string(run.language->data(), static_cast<int>(run.language->size()));
    if (language == HB_LANGUAGE_INVALID) {
      error = "Shaping error: unsupported language '" + *run.language + "'";
      return std::nullopt;
    }
    hb_buffer_set_language(buffer.get(), language);
  }
  hb_buffer_guess_segment_properties(buffer.get());

  ShapedRun shaped;
  shaped.sizePx = sizePx;
  {
    auto lock = font.lock();
    if (!font.applySize(sizePx)) {
      error = "Shaping error: cannot set font size " + std::to_string(sizePx) + " on '" + font.path() + "'";
      return std::nullopt;
    }
    hb_shape(font.hbFont(), buffer.get(), features->data(), static_cast<unsigned>(features->size()));
  }

  unsigned int count = 0;
  hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer.get(), &count);
  hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer.get(), nullptr);
  if (count == 0 || !infos || !positions) {
    error = "Shaping error: no glyphs produced for '" + run.content + "' with '" + font.path() + "'";
    return std::nullopt;
  }

  shaped.glyphs.reserve(count);
  for (unsigned int i = 0; i < count; ++i) {
    ShapedGlyph glyph;
    glyph.glyphId = infos[i].codepoint;
    glyph.cluster = infos[i].cluster;
    glyph.xAdvance = static_cast<float>(positions[i].x_advance) / 64.0f;
    glyph.yAdvance = static_cast<float>(positions[i].y_advance) / 64.0f;
    glyph.xOffset = static_cast<float>(positions[i].x_offset) / 64.0f;
    glyph.yOffset = static_cast<float>(positions[i].y_offset) / 64.0f;
    shaped.glyphs.push_back(glyph);
  }
  return shaped;
}

} // namespace PrimeGlyph
