#pragma once
/**
 * @file glyph_source.hpp
 * @brief Font abstraction used by layout and text rendering
 *
 * A GlyphSource answers three questions for one font face at a pixel size:
 * does it cover a code point, how far does the pen advance, and what
 * coverage bitmap does the glyph produce. FreeTypeFace is the production
 * implementation; tests plug in synthetic sources.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace WordCard::Text {

/// Vertical metrics at one pixel size (all positive, in pixels)
struct FaceMetrics {
  float ascent = 0.0f;
  float descent = 0.0f;
  float line_gap = 0.0f;
};

/// 8-bit coverage bitmap of one glyph
struct GlyphBitmap {
  std::vector<uint8_t> coverage;
  uint32_t width = 0;
  uint32_t height = 0;
  int32_t left = 0; ///< Offset from pen x to the bitmap's left edge
  int32_t top = 0;  ///< Offset from baseline up to the bitmap's top edge
};

/**
 * @brief One font face that can measure and rasterize code points
 */
class GlyphSource {
public:
  virtual ~GlyphSource() = default;

  /// Human readable name for diagnostics
  [[nodiscard]] virtual std::string name() const = 0;

  /// True if the face has a real glyph (not .notdef) for @p cp
  [[nodiscard]] virtual bool has_glyph(char32_t cp) const = 0;

  [[nodiscard]] virtual FaceMetrics metrics(uint32_t pixel_size) const = 0;

  /// Horizontal advance in pixels
  [[nodiscard]] virtual float advance(char32_t cp,
                                      uint32_t pixel_size) const = 0;

  /// Kerning adjustment between two code points of this face
  [[nodiscard]] virtual float kerning(char32_t /*left*/, char32_t /*right*/,
                                      uint32_t /*pixel_size*/) const {
    return 0.0f;
  }

  [[nodiscard]] virtual GlyphBitmap rasterize(char32_t cp,
                                              uint32_t pixel_size) const = 0;
};

/// Which text field a line belongs to
enum class TextRole { English, Phonetic, Chinese };

/**
 * @brief Latin and CJK faces used together for one card
 *
 * English and phonetic lines prefer the Latin face; Chinese lines prefer
 * the CJK face. Each falls back to the other face per code point.
 */
struct FontSet {
  std::shared_ptr<const GlyphSource> latin;
  std::shared_ptr<const GlyphSource> cjk;

  [[nodiscard]] bool valid() const noexcept { return latin && cjk; }

  [[nodiscard]] const GlyphSource &primary(TextRole role) const {
    return role == TextRole::Chinese ? *cjk : *latin;
  }

  [[nodiscard]] const GlyphSource &fallback(TextRole role) const {
    return role == TextRole::Chinese ? *latin : *cjk;
  }

  /// Largest ascent/descent of both faces, so mixed lines share one box
  [[nodiscard]] FaceMetrics line_metrics(uint32_t pixel_size) const;
};

} // namespace WordCard::Text
