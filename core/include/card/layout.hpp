#pragma once
/**
 * @file layout.hpp
 * @brief Card text layout: wrapping, font fitting and panel placement
 *
 * Layout is a pure function of the canvas size, the texts, the requested
 * sizes and the fonts' measurements. It never touches pixels.
 */

#include "card/device_profile.hpp"
#include "card/theme.hpp"
#include "core/color.hpp"
#include "core/math.hpp"
#include "core/result.hpp"
#include "text/glyph_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace WordCard {

/// Wrap width as a fraction of the canvas width
constexpr float kWrapWidthRatio = 0.8f;
/// Smallest per-field font size as a fraction of the requested size
constexpr float kMinFieldScale = 0.5f;
/// Gap between lines of one group, fraction of the group's font size
constexpr float kInnerLineGap = 0.15f;
/// English to phonetic gap, fraction of the phonetic size
constexpr float kPhoneticGap = 0.2f;
/// Gap above the Chinese group, fraction of the Chinese size
constexpr float kChineseGap = 0.4f;
/// Canvas margin, fraction of the shorter canvas side
constexpr float kMarginRatio = 0.04f;
/// Whole-block shrink step and floor when the panel overflows the canvas
constexpr float kGlobalShrinkStep = 0.05f;
constexpr float kMinGlobalScale = 0.5f;

/// Decoration geometry
constexpr float kDividerMaxRatio = 0.4f; ///< of the canvas width
constexpr float kDividerMaxWidth = 200.0f; ///< times the font scale
constexpr float kDotRadius = 3.0f;
constexpr float kDotGap = 15.0f;

/// Everything the layout depends on
struct LayoutRequest {
  CanvasSize canvas;
  std::string english;
  std::string chinese;
  std::optional<std::string> phonetic;

  uint32_t size_en = 60;
  uint32_t size_cn = 45;
  uint32_t size_phonetic = 18;
  float font_scale = 1.0f;

  ThemeSpec theme = theme_spec(ThemeName::Standard);
  BackgroundShape shape = BackgroundShape::Rectangle;
};

/// One positioned line of text
struct LayoutLine {
  std::u32string text;
  Text::TextRole role = Text::TextRole::English;
  uint32_t font_size = 0;
  Color::RGBA color;
  Math::Vec2f baseline; ///< Pen origin of the first glyph
  float width = 0.0f;   ///< Advance width
};

/// Divider between the English/phonetic block and the Chinese group
struct DividerPlacement {
  float center_x = 0.0f;
  float center_y = 0.0f;
  float width = 0.0f;
};

/// Output of LayoutEngine::compute
struct CardLayout {
  std::vector<LayoutLine> lines; ///< English, then phonetic, then Chinese
  Math::RectF text_rect;
  Math::RectF panel_rect;
  std::optional<DividerPlacement> divider;

  uint32_t size_en = 0; ///< Effective sizes after all shrinking
  uint32_t size_phonetic = 0;
  uint32_t size_cn = 0;
  float global_scale = 1.0f; ///< 1.0 unless the panel had to shrink
};

/**
 * @brief Computes line boxes and the panel rectangle for one card
 */
class LayoutEngine {
public:
  explicit LayoutEngine(Text::FontSet fonts);

  /**
   * @brief Lay out one card
   * @return RenderFailure when a code point has no glyph, InvalidGeometry
   *         when the text block cannot fit the canvas
   */
  [[nodiscard]] CardResult<CardLayout> compute(const LayoutRequest &request) const;

  /// Advance width of a line at a size
  [[nodiscard]] CardResult<float> measure(std::u32string_view text,
                                          Text::TextRole role,
                                          uint32_t pixel_size) const;

  /// One wrapped field: its final size and lines
  struct WrappedField {
    uint32_t font_size = 0;
    std::vector<std::u32string> lines;
    std::vector<float> widths;
  };

  /**
   * @brief Wrap a field to @p max_width, shrinking if a word overflows
   *
   * Starts at @p base_size scaled by @p start_scale and steps down one pixel
   * at a time to ceil(50%) of @p base_size; a word still too wide at that
   * floor is broken between characters.
   */
  [[nodiscard]] CardResult<WrappedField> wrap_field(std::u32string_view text,
                                                    Text::TextRole role,
                                                    uint32_t base_size,
                                                    float max_width,
                                                    float start_scale = 1.0f) const;

private:
  Text::FontSet fonts_;

  CardResult<std::vector<std::u32string>>
  wrap_lines(std::u32string_view text, Text::TextRole role, uint32_t size,
             float max_width, bool break_words) const;

  CardResult<CardLayout> try_layout(const LayoutRequest &request,
                                    float global_scale) const;
};

} // namespace WordCard
