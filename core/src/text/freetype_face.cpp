/**
 * @file freetype_face.cpp
 * @brief FreeType glyph loading, metrics and rasterization
 */

#include "text/freetype_face.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>

namespace WordCard::Text {

CardResult<std::shared_ptr<FreeTypeFace>>
FreeTypeFace::load(const std::string &path) {
  FT_Library library = nullptr;
  FT_Error error = FT_Init_FreeType(&library);
  if (error) {
    return make_error(CardErrorCode::InvalidConfiguration,
                      "Failed to initialize FreeType (error " +
                          std::to_string(error) + ")");
  }

  FT_Face face = nullptr;
  error = FT_New_Face(library, path.c_str(), 0, &face);
  if (error) {
    FT_Done_FreeType(library);
    return make_error(CardErrorCode::InvalidConfiguration,
                      "Failed to load font file: " + path + " (error " +
                          std::to_string(error) + ")");
  }

  if (!(face->face_flags & FT_FACE_FLAG_SCALABLE)) {
    FT_Done_Face(face);
    FT_Done_FreeType(library);
    return make_error(CardErrorCode::InvalidConfiguration,
                      "Font is not scalable: " + path);
  }

  std::cout << "🔤 Font loaded: " << (face->family_name ? face->family_name : "?")
            << " " << (face->style_name ? face->style_name : "") << " ("
            << path << ")" << std::endl;

  return std::shared_ptr<FreeTypeFace>(new FreeTypeFace(library, face, path));
}

FreeTypeFace::FreeTypeFace(FT_Library library, FT_Face face, std::string path)
    : ftLibrary_(library), ftFace_(face), path_(std::move(path)) {}

FreeTypeFace::~FreeTypeFace() {
  if (ftFace_)
    FT_Done_Face(ftFace_);
  if (ftLibrary_)
    FT_Done_FreeType(ftLibrary_);
}

std::string FreeTypeFace::name() const {
  std::string family = ftFace_->family_name ? ftFace_->family_name : "unknown";
  if (ftFace_->style_name) {
    family += " ";
    family += ftFace_->style_name;
  }
  return family;
}

void FreeTypeFace::select_size(uint32_t pixel_size) const {
  if (activeSize_ == pixel_size) {
    return;
  }
  FT_Set_Pixel_Sizes(ftFace_, 0, pixel_size);
  activeSize_ = pixel_size;
}

bool FreeTypeFace::has_glyph(char32_t cp) const {
  return FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(cp)) != 0;
}

FaceMetrics FreeTypeFace::metrics(uint32_t pixel_size) const {
  select_size(pixel_size);
  const FT_Size_Metrics &m = ftFace_->size->metrics;

  FaceMetrics result;
  result.ascent = static_cast<float>(m.ascender) / 64.0f;
  result.descent = static_cast<float>(std::labs(m.descender)) / 64.0f;
  result.line_gap = static_cast<float>(m.height - (m.ascender - m.descender)) /
                    64.0f;
  if (result.line_gap < 0.0f) {
    result.line_gap = 0.0f;
  }
  return result;
}

float FreeTypeFace::advance(char32_t cp, uint32_t pixel_size) const {
  const uint64_t key = cache_key(cp, pixel_size);
  auto it = advanceCache_.find(key);
  if (it != advanceCache_.end()) {
    return it->second;
  }

  select_size(pixel_size);
  FT_UInt glyphIndex = FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(cp));
  float value = 0.0f;
  if (FT_Load_Glyph(ftFace_, glyphIndex, FT_LOAD_DEFAULT) == 0) {
    value = static_cast<float>(ftFace_->glyph->advance.x) / 64.0f;
  }
  advanceCache_.emplace(key, value);
  return value;
}

float FreeTypeFace::kerning(char32_t left, char32_t right,
                            uint32_t pixel_size) const {
  if (!FT_HAS_KERNING(ftFace_)) {
    return 0.0f;
  }
  select_size(pixel_size);
  FT_Vector delta{};
  FT_UInt l = FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(left));
  FT_UInt r = FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(right));
  if (FT_Get_Kerning(ftFace_, l, r, FT_KERNING_DEFAULT, &delta)) {
    return 0.0f;
  }
  return static_cast<float>(delta.x) / 64.0f;
}

GlyphBitmap FreeTypeFace::rasterize(char32_t cp, uint32_t pixel_size) const {
  const uint64_t key = cache_key(cp, pixel_size);
  auto it = bitmapCache_.find(key);
  if (it != bitmapCache_.end()) {
    return it->second;
  }

  GlyphBitmap result;
  select_size(pixel_size);

  FT_UInt glyphIndex = FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(cp));
  if (FT_Load_Glyph(ftFace_, glyphIndex, FT_LOAD_DEFAULT) ||
      FT_Render_Glyph(ftFace_->glyph, FT_RENDER_MODE_NORMAL)) {
    std::cerr << "⚠️ FreeType: cannot render U+" << std::hex
              << static_cast<uint32_t>(cp) << std::dec << " from " << name()
              << std::endl;
    bitmapCache_.emplace(key, result);
    return result;
  }

  const FT_GlyphSlot slot = ftFace_->glyph;
  const FT_Bitmap &bitmap = slot->bitmap;

  result.width = bitmap.width;
  result.height = bitmap.rows;
  result.left = slot->bitmap_left;
  result.top = slot->bitmap_top;
  result.coverage.resize(static_cast<size_t>(bitmap.width) * bitmap.rows);

  // Pitch is negative for bottom-up bitmaps
  for (uint32_t y = 0; y < bitmap.rows; y++) {
    const unsigned char *row =
        bitmap.pitch >= 0
            ? bitmap.buffer + static_cast<ptrdiff_t>(y) * bitmap.pitch
            : bitmap.buffer +
                  static_cast<ptrdiff_t>(bitmap.rows - 1 - y) * -bitmap.pitch;
    for (uint32_t x = 0; x < bitmap.width; x++) {
      result.coverage[static_cast<size_t>(y) * bitmap.width + x] = row[x];
    }
  }

  bitmapCache_.emplace(key, result);
  return result;
}

} // namespace WordCard::Text
