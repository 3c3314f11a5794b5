#pragma once
/**
 * @file test_support.hpp
 * @brief Shared fixtures: synthetic glyph sources, images, temp directories
 */

#include "core/image_buffer.hpp"
#include "text/glyph_source.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace WordCard::Testing {

/**
 * @brief Font stand-in that draws every glyph as a solid box
 *
 * Latin covers printable ASCII, Latin-1, Latin Extended and IPA; CJK covers CJK code
 * points, ASCII digits and the space. Advances are 0.6 em (Latin) and
 * 1.0 em (CJK); boxes are inset 15% on each side and 0.7 em tall.
 */
class BoxGlyphSource final : public Text::GlyphSource {
public:
  enum class Coverage { Latin, Cjk };

  explicit BoxGlyphSource(Coverage coverage) : coverage_(coverage) {}

  std::string name() const override {
    return coverage_ == Coverage::Latin ? "BoxLatin" : "BoxCJK";
  }

  bool has_glyph(char32_t cp) const override {
    if (coverage_ == Coverage::Latin) {
      return (cp >= 0x20 && cp < 0x7F) || (cp >= 0x00A0 && cp <= 0x02FF);
    }
    return Text::is_cjk(cp) || cp == U' ' || (cp >= U'0' && cp <= U'9');
  }

  Text::FaceMetrics metrics(uint32_t px) const override {
    return {0.8f * px, 0.2f * px, 0.0f};
  }

  float advance(char32_t cp, uint32_t px) const override {
    if (cp == U' ') {
      return 0.3f * px;
    }
    return (coverage_ == Coverage::Latin ? 0.6f : 1.0f) * px;
  }

  Text::GlyphBitmap rasterize(char32_t cp, uint32_t px) const override {
    Text::GlyphBitmap bmp;
    if (cp == U' ') {
      return bmp;
    }
    float adv = advance(cp, px);
    bmp.left = static_cast<int32_t>(std::lround(adv * 0.15f));
    bmp.width = std::max<uint32_t>(
        1, static_cast<uint32_t>(std::lround(adv * 0.7f)));
    bmp.height = std::max<uint32_t>(
        1, static_cast<uint32_t>(std::lround(px * 0.7f)));
    bmp.top = static_cast<int32_t>(bmp.height);
    bmp.coverage.assign(static_cast<size_t>(bmp.width) * bmp.height, 255);
    return bmp;
  }

private:
  Coverage coverage_;
};

/// Latin and CJK box sources
inline Text::FontSet box_fonts() {
  Text::FontSet fonts;
  fonts.latin = std::make_shared<BoxGlyphSource>(BoxGlyphSource::Coverage::Latin);
  fonts.cjk = std::make_shared<BoxGlyphSource>(BoxGlyphSource::Coverage::Cjk);
  return fonts;
}

/// Opaque image of one color
inline ImageBuffer solid_image(uint32_t w, uint32_t h, uint8_t r, uint8_t g,
                               uint8_t b) {
  ImageBuffer img = ImageBuffer::create(w, h);
  img.fill(r, g, b, 255);
  return img;
}

/// Horizontal and vertical ramps so crops and scales are observable
inline ImageBuffer gradient_image(uint32_t w, uint32_t h) {
  ImageBuffer img = ImageBuffer::create(w, h);
  for (uint32_t y = 0; y < h; ++y) {
    for (uint32_t x = 0; x < w; ++x) {
      uint8_t *p = img.pixel(x, y);
      p[0] = static_cast<uint8_t>(x * 255 / std::max<uint32_t>(1, w - 1));
      p[1] = static_cast<uint8_t>(y * 255 / std::max<uint32_t>(1, h - 1));
      p[2] = 128;
      p[3] = 255;
    }
  }
  return img;
}

/// Pixel-wise equality over the RGB channels
inline bool same_rgb(const uint8_t *a, const uint8_t *b) {
  return a[0] == b[0] && a[1] == b[1] && a[2] == b[2];
}

/**
 * @brief Fresh directory under the system temp dir, removed on destruction
 */
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("wordcard_" + tag + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const noexcept {
    return path_;
  }

  /// Absolute path of a child entry
  [[nodiscard]] std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

/// Write raw bytes (used for word lists and corrupt images)
inline void write_text_file(const std::string &path, const std::string &text) {
  std::ofstream out(path, std::ios::binary);
  out << text;
}

/// Read a whole file as bytes
inline std::vector<uint8_t> read_bytes(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  return bytes;
}

} // namespace WordCard::Testing
