/**
 * @file text_renderer.cpp
 * @brief Glyph blitting with shadow and stroke passes
 */

#include "card/text_renderer.hpp"
#include "text/shaper.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace WordCard {

using Color::RGBA;
using Text::GlyphBitmap;
using Text::ShapedLine;

namespace {

/// Pixel offset of a pass relative to the real glyph position
struct StampOffset {
  int32_t dx;
  int32_t dy;
};

/// Every integer offset within the stroke radius, center excluded
std::vector<StampOffset> stroke_offsets(float stroke_width) {
  std::vector<StampOffset> offsets;
  const auto r = static_cast<int32_t>(std::ceil(stroke_width));
  const float r2 = stroke_width * stroke_width;
  for (int32_t dy = -r; dy <= r; ++dy) {
    for (int32_t dx = -r; dx <= r; ++dx) {
      if ((dx != 0 || dy != 0) && static_cast<float>(dx * dx + dy * dy) <= r2) {
        offsets.push_back({dx, dy});
      }
    }
  }
  return offsets;
}

void blit_glyph(ImageBuffer &canvas, const GlyphBitmap &bmp, int32_t pen_x,
                int32_t baseline_y, RGBA color) {
  const int32_t x0 = pen_x + bmp.left;
  const int32_t y0 = baseline_y - bmp.top;
  const auto cw = static_cast<int32_t>(canvas.width);
  const auto ch = static_cast<int32_t>(canvas.height);

  for (uint32_t gy = 0; gy < bmp.height; ++gy) {
    const int32_t img_y = y0 + static_cast<int32_t>(gy);
    if (img_y < 0 || img_y >= ch) {
      continue;
    }
    for (uint32_t gx = 0; gx < bmp.width; ++gx) {
      const int32_t img_x = x0 + static_cast<int32_t>(gx);
      if (img_x < 0 || img_x >= cw) {
        continue;
      }
      uint8_t coverage = bmp.coverage[gy * bmp.width + gx];
      if (coverage == 0) {
        continue;
      }
      Color::blend_pixel(canvas.pixel(img_x, img_y), color, coverage / 255.0f);
    }
  }
}

/// Shape every layout line once; all passes reuse the result
CardResult<std::vector<ShapedLine>> shape_all(const CardLayout &layout,
                                              const Text::FontSet &fonts) {
  std::vector<ShapedLine> shaped;
  shaped.reserve(layout.lines.size());
  for (const LayoutLine &line : layout.lines) {
    auto s = Text::shape_line(line.text, line.role, fonts, line.font_size);
    if (!s) {
      return s.error();
    }
    shaped.push_back(std::move(*s));
  }
  return shaped;
}

/// Visit every drawable glyph with its integer pen position
template <typename Fn>
void for_each_glyph(const CardLayout &layout,
                    const std::vector<ShapedLine> &shaped, Fn &&fn) {
  for (size_t i = 0; i < layout.lines.size(); ++i) {
    const LayoutLine &line = layout.lines[i];
    const auto baseline_y = static_cast<int32_t>(std::lround(line.baseline.y));
    for (const auto &glyph : shaped[i].glyphs) {
      if (glyph.source == nullptr) {
        continue;
      }
      const auto pen_x =
          static_cast<int32_t>(std::lround(line.baseline.x + glyph.x));
      fn(line, *glyph.source, glyph.code_point, pen_x, baseline_y);
    }
  }
}

} // anonymous namespace

TextRenderer::TextRenderer(Text::FontSet fonts) : fonts_(std::move(fonts)) {}

CardResult<void> TextRenderer::draw(ImageBuffer &canvas,
                                    const CardLayout &layout,
                                    const ThemeSpec &theme) const {
  auto shaped = shape_all(layout, fonts_);
  if (!shaped) {
    return shaped.error();
  }

  auto pass = [&](int32_t dx, int32_t dy, const RGBA *override_color) {
    for_each_glyph(layout, *shaped,
                   [&](const LayoutLine &line, const Text::GlyphSource &source,
                       char32_t cp, int32_t pen_x, int32_t baseline_y) {
                     GlyphBitmap bmp = source.rasterize(cp, line.font_size);
                     blit_glyph(canvas, bmp, pen_x + dx, baseline_y + dy,
                                override_color ? *override_color : line.color);
                   });
  };

  if (theme.draws_shadow()) {
    pass(theme.shadow_offset, theme.shadow_offset, &theme.shadow_color);
  }

  if (theme.stroke_width > 0.0f) {
    for (const StampOffset &o : stroke_offsets(theme.stroke_width)) {
      pass(o.dx, o.dy, &theme.stroke_color);
    }
  }

  pass(0, 0, nullptr);
  return {};
}

CardResult<Math::RectI> TextRenderer::ink_bounds(const CardLayout &layout,
                                                 const ThemeSpec &theme,
                                                 uint32_t canvas_width,
                                                 uint32_t canvas_height) const {
  auto shaped = shape_all(layout, fonts_);
  if (!shaped) {
    return shaped.error();
  }

  int32_t spread_lo = 0;
  int32_t spread_hi = 0;
  if (theme.draws_shadow()) {
    spread_lo = std::min(spread_lo, theme.shadow_offset);
    spread_hi = std::max(spread_hi, theme.shadow_offset);
  }
  if (theme.stroke_width > 0.0f) {
    const auto r = static_cast<int32_t>(std::ceil(theme.stroke_width));
    spread_lo = std::min(spread_lo, -r);
    spread_hi = std::max(spread_hi, r);
  }

  bool any = false;
  int32_t x0 = 0, y0 = 0, x1 = 0, y1 = 0;
  for_each_glyph(layout, *shaped,
                 [&](const LayoutLine &line, const Text::GlyphSource &source,
                     char32_t cp, int32_t pen_x, int32_t baseline_y) {
                   GlyphBitmap bmp = source.rasterize(cp, line.font_size);
                   if (bmp.width == 0 || bmp.height == 0) {
                     return;
                   }
                   int32_t gx0 = pen_x + bmp.left + spread_lo;
                   int32_t gy0 = baseline_y - bmp.top + spread_lo;
                   int32_t gx1 = pen_x + bmp.left +
                                 static_cast<int32_t>(bmp.width) + spread_hi;
                   int32_t gy1 = baseline_y - bmp.top +
                                 static_cast<int32_t>(bmp.height) + spread_hi;
                   if (!any) {
                     x0 = gx0, y0 = gy0, x1 = gx1, y1 = gy1;
                     any = true;
                   } else {
                     x0 = std::min(x0, gx0);
                     y0 = std::min(y0, gy0);
                     x1 = std::max(x1, gx1);
                     y1 = std::max(y1, gy1);
                   }
                 });

  if (!any) {
    return Math::RectI{};
  }
  const auto cw = static_cast<int32_t>(canvas_width);
  const auto ch = static_cast<int32_t>(canvas_height);
  x0 = Math::clamp(x0, 0, cw);
  y0 = Math::clamp(y0, 0, ch);
  x1 = Math::clamp(x1, x0, cw);
  y1 = Math::clamp(y1, y0, ch);
  return Math::RectI{x0, y0, x1 - x0, y1 - y0};
}

} // namespace WordCard
