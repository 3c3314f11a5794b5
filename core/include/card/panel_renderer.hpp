#pragma once
/**
 * @file panel_renderer.hpp
 * @brief Themed panel, decorations and backdrop effects
 */

#include "card/layout.hpp"
#include "card/outline.hpp"
#include "card/theme.hpp"
#include "core/image_buffer.hpp"
#include "core/result.hpp"

namespace WordCard {

/// Alpha of the divider's first row and the per-row fade
constexpr int kDividerRows = 5;
constexpr int kDividerTopAlpha = 150;
constexpr int kDividerAlphaStep = 30;
constexpr uint8_t kDotAlpha = 180;

/**
 * @brief Draws the panel beneath the text
 *
 * Rectangle and wave panels share one fill path; the outline generator
 * chosen for the background shape is the only difference.
 */
class PanelRenderer {
public:
  /**
   * @brief Fill the panel into @p canvas
   * @return InvalidGeometry for a non-positive or non-finite panel size
   */
  [[nodiscard]] CardResult<void> draw(ImageBuffer &canvas,
                                      const Math::RectF &panel_rect,
                                      const ThemeSpec &theme,
                                      const BackgroundStyle &style) const;

  /// Fading divider and its two dots
  void draw_decorations(ImageBuffer &canvas, const DividerPlacement &divider,
                        const ThemeSpec &theme) const;

  /// Whole-canvas blur and dimming, applied before the panel
  void apply_backdrop(ImageBuffer &canvas, const ThemeSpec &theme) const;

private:
  void fill_solid(ImageBuffer &canvas, const CoverageMask &mask,
                  Color::RGBA color) const;
  void fill_gradient(ImageBuffer &canvas, const CoverageMask &mask,
                     const Math::RectF &rect, Color::RGBA top,
                     Color::RGBA bottom) const;
  void fill_blurred(ImageBuffer &canvas, const CoverageMask &mask,
                    float sigma) const;
};

} // namespace WordCard
