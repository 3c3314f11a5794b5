/**
 * @file shaper.cpp
 * @brief Per-code-point font selection and pen positioning
 */

#include "text/shaper.hpp"
#include "text/utf8.hpp"

#include <cstdio>

namespace WordCard::Text {

namespace {

std::string code_point_label(char32_t cp) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
  return buf;
}

} // anonymous namespace

CardResult<ShapedLine> shape_line(std::u32string_view text, TextRole role,
                                  const FontSet &fonts, uint32_t pixel_size) {
  if (!fonts.valid()) {
    return make_error(CardErrorCode::RenderFailure, "Font set is incomplete");
  }

  const GlyphSource &primary = fonts.primary(role);
  const GlyphSource &fallback = fonts.fallback(role);

  ShapedLine line;
  line.glyphs.reserve(text.size());
  float pen = 0.0f;
  const GlyphSource *prev_source = nullptr;
  char32_t prev_cp = 0;

  for (char32_t cp : text) {
    // Control characters never reach the canvas
    if (cp < 0x20 && cp != U'\t') {
      continue;
    }

    const GlyphSource *source = nullptr;
    if (primary.has_glyph(cp)) {
      source = &primary;
    } else if (fallback.has_glyph(cp)) {
      source = &fallback;
    }

    ShapedGlyph glyph;
    glyph.code_point = cp;

    if (source == nullptr) {
      if (!is_space(cp)) {
        return make_error(CardErrorCode::RenderFailure,
                          "No glyph for " + code_point_label(cp) + " in " +
                              primary.name() + " or " + fallback.name());
      }
      glyph.advance = static_cast<float>(pixel_size) * 0.25f;
    } else {
      if (source == prev_source) {
        pen += source->kerning(prev_cp, cp, pixel_size);
      }
      glyph.advance = source->advance(cp, pixel_size);
      // Whitespace is measured but not drawn
      if (!is_space(cp)) {
        glyph.source = source;
      }
    }

    glyph.x = pen;
    pen += glyph.advance;
    line.glyphs.push_back(glyph);
    prev_source = source;
    prev_cp = cp;
  }

  line.width = pen;
  return line;
}

} // namespace WordCard::Text
