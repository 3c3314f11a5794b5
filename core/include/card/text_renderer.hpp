#pragma once
/**
 * @file text_renderer.hpp
 * @brief Draws laid-out card text with shadow or stroke
 */

#include "card/layout.hpp"
#include "card/theme.hpp"
#include "core/image_buffer.hpp"
#include "core/result.hpp"
#include "text/glyph_source.hpp"

namespace WordCard {

/**
 * @brief Glyph blitter for CardLayout lines
 *
 * Passes run over all lines in order: drop shadow (themes with a shadow,
 * and every panel-less theme), then stroke outline, then the fill.
 */
class TextRenderer {
public:
  explicit TextRenderer(Text::FontSet fonts);

  /// @return RenderFailure when a code point has no glyph in either face
  [[nodiscard]] CardResult<void> draw(ImageBuffer &canvas,
                                      const CardLayout &layout,
                                      const ThemeSpec &theme) const;

  /**
   * @brief Pixel rectangle touched by draw(), shadow and stroke included
   *
   * Clipped to the canvas size.
   */
  [[nodiscard]] CardResult<Math::RectI>
  ink_bounds(const CardLayout &layout, const ThemeSpec &theme,
             uint32_t canvas_width, uint32_t canvas_height) const;

private:
  Text::FontSet fonts_;
};

} // namespace WordCard
