#pragma once
/**
 * @file freetype_face.hpp
 * @brief GlyphSource backed by a FreeType face
 */

#include "core/result.hpp"
#include "text/glyph_source.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <memory>
#include <string>
#include <unordered_map>

namespace WordCard::Text {

/**
 * @brief FreeType face with per-size advance and bitmap caches
 *
 * Not thread-safe: the face's active pixel size and the caches are mutated
 * on every query. Give each worker its own instance.
 */
class FreeTypeFace final : public GlyphSource {
public:
  /// Load face 0 of a font file (.ttf, .otf, .ttc)
  static CardResult<std::shared_ptr<FreeTypeFace>>
  load(const std::string &path);

  ~FreeTypeFace() override;

  FreeTypeFace(const FreeTypeFace &) = delete;
  FreeTypeFace &operator=(const FreeTypeFace &) = delete;

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] bool has_glyph(char32_t cp) const override;
  [[nodiscard]] FaceMetrics metrics(uint32_t pixel_size) const override;
  [[nodiscard]] float advance(char32_t cp, uint32_t pixel_size) const override;
  [[nodiscard]] float kerning(char32_t left, char32_t right,
                              uint32_t pixel_size) const override;
  [[nodiscard]] GlyphBitmap rasterize(char32_t cp,
                                      uint32_t pixel_size) const override;

  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  FreeTypeFace(FT_Library library, FT_Face face, std::string path);

  void select_size(uint32_t pixel_size) const;

  static uint64_t cache_key(char32_t cp, uint32_t pixel_size) noexcept {
    return (static_cast<uint64_t>(pixel_size) << 32) | cp;
  }

  FT_Library ftLibrary_ = nullptr;
  FT_Face ftFace_ = nullptr;
  std::string path_;

  mutable uint32_t activeSize_ = 0;
  mutable std::unordered_map<uint64_t, float> advanceCache_;
  mutable std::unordered_map<uint64_t, GlyphBitmap> bitmapCache_;
};

} // namespace WordCard::Text
