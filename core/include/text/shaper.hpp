#pragma once
/**
 * @file shaper.hpp
 * @brief Split a line into per-font glyph runs and measure it
 */

#include "core/result.hpp"
#include "text/glyph_source.hpp"

#include <string_view>
#include <vector>

namespace WordCard::Text {

/// One positioned code point
struct ShapedGlyph {
  char32_t code_point = 0;
  const GlyphSource *source = nullptr; ///< nullptr for whitespace
  float x = 0.0f;                      ///< Pen offset from the line start
  float advance = 0.0f;
};

/// Glyphs of one line plus its advance width
struct ShapedLine {
  std::vector<ShapedGlyph> glyphs;
  float width = 0.0f;
};

/**
 * @brief Assign every code point to a face and lay the glyphs out
 *
 * The role's primary face is used when it covers the code point, else the
 * other script's face. Whitespace without a glyph in either face advances
 * by a quarter em. Any other uncovered code point is a RenderFailure.
 */
[[nodiscard]] CardResult<ShapedLine> shape_line(std::u32string_view text,
                                                TextRole role,
                                                const FontSet &fonts,
                                                uint32_t pixel_size);

} // namespace WordCard::Text
