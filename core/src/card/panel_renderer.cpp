/**
 * @file panel_renderer.cpp
 * @brief Panel fills, decorations and backdrop effects
 */

#include "card/panel_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace WordCard {

using Color::RGBA;
using Math::RectF;
using Math::RectI;

CardResult<void> PanelRenderer::draw(ImageBuffer &canvas,
                                     const RectF &panel_rect,
                                     const ThemeSpec &theme,
                                     const BackgroundStyle &style) const {
  if (!std::isfinite(panel_rect.x) || !std::isfinite(panel_rect.y) ||
      !std::isfinite(panel_rect.width) || !std::isfinite(panel_rect.height) ||
      panel_rect.width <= 0.0f || panel_rect.height <= 0.0f) {
    return make_error(CardErrorCode::InvalidGeometry,
                      "Panel size must be positive, got " +
                          std::to_string(panel_rect.width) + "x" +
                          std::to_string(panel_rect.height));
  }

  if (!theme.draws_panel()) {
    return {};
  }

  auto generator = make_outline_generator(style.shape, theme);
  Outline outline = generator->generate(panel_rect);
  CoverageMask mask =
      CoverageMask::rasterize(outline, canvas.width, canvas.height);
  if (mask.bounds().empty()) {
    return {};
  }

  switch (theme.panel_fill) {
  case PanelFill::Solid:
    fill_solid(canvas, mask, theme.panel_color);
    break;
  case PanelFill::Gradient:
    fill_gradient(canvas, mask, panel_rect, theme.gradient_top,
                  theme.gradient_bottom);
    break;
  case PanelFill::Blurred:
    fill_blurred(canvas, mask, theme.blur_sigma);
    fill_solid(canvas, mask, theme.panel_color);
    break;
  case PanelFill::None:
    break;
  }
  return {};
}

void PanelRenderer::fill_solid(ImageBuffer &canvas, const CoverageMask &mask,
                               RGBA color) const {
  const RectI &b = mask.bounds();
  for (int32_t y = b.y; y < b.y + b.height; ++y) {
    for (int32_t x = b.x; x < b.x + b.width; ++x) {
      float cov = mask.at(x, y);
      if (cov > 0.0f) {
        Color::blend_pixel(canvas.pixel(x, y), color, cov);
      }
    }
  }
}

void PanelRenderer::fill_gradient(ImageBuffer &canvas, const CoverageMask &mask,
                                  const RectF &rect, RGBA top,
                                  RGBA bottom) const {
  const RectI &b = mask.bounds();
  for (int32_t y = b.y; y < b.y + b.height; ++y) {
    float t = Math::saturate((y + 0.5f - rect.top()) / rect.height);
    RGBA row_color = Color::lerp(top, bottom, t);
    for (int32_t x = b.x; x < b.x + b.width; ++x) {
      float cov = mask.at(x, y);
      if (cov > 0.0f) {
        Color::blend_pixel(canvas.pixel(x, y), row_color, cov);
      }
    }
  }
}

void PanelRenderer::fill_blurred(ImageBuffer &canvas, const CoverageMask &mask,
                                 float sigma) const {
  if (sigma <= 0.0f) {
    return;
  }
  const RectI &b = mask.bounds();

  // Blur a copy with enough surrounding pixels for the kernel
  const auto pad = static_cast<int32_t>(std::ceil(3.0f * sigma));
  const auto cw = static_cast<int32_t>(canvas.width);
  const auto ch = static_cast<int32_t>(canvas.height);
  RectI work_rect;
  work_rect.x = std::max(0, b.x - pad);
  work_rect.y = std::max(0, b.y - pad);
  work_rect.width = std::min(cw, b.x + b.width + pad) - work_rect.x;
  work_rect.height = std::min(ch, b.y + b.height + pad) - work_rect.y;

  ImageBuffer work = canvas.crop(work_rect);
  RectI local{b.x - work_rect.x, b.y - work_rect.y, b.width, b.height};
  gaussian_blur(work, local, sigma);

  for (int32_t y = b.y; y < b.y + b.height; ++y) {
    for (int32_t x = b.x; x < b.x + b.width; ++x) {
      float cov = mask.at(x, y);
      if (cov <= 0.0f) {
        continue;
      }
      const uint8_t *src = work.pixel(x - work_rect.x, y - work_rect.y);
      Color::blend_pixel(canvas.pixel(x, y), RGBA{src[0], src[1], src[2], 255},
                         cov);
    }
  }
}

void PanelRenderer::draw_decorations(ImageBuffer &canvas,
                                     const DividerPlacement &divider,
                                     const ThemeSpec &theme) const {
  if (!theme.decoration || divider.width <= 0.0f) {
    return;
  }

  const float x0 = divider.center_x - divider.width * 0.5f;
  const float x1 = divider.center_x + divider.width * 0.5f;
  const auto first_row =
      static_cast<int32_t>(std::lround(divider.center_y)) - kDividerRows / 2;
  const auto px0 = std::max(0, static_cast<int32_t>(std::floor(x0)));
  const auto px1 = std::min(static_cast<int32_t>(canvas.width),
                            static_cast<int32_t>(std::ceil(x1)));

  for (int row = 0; row < kDividerRows; ++row) {
    int32_t y = first_row + row;
    if (y < 0 || y >= static_cast<int32_t>(canvas.height)) {
      continue;
    }
    RGBA color = Color::with_alpha(
        theme.text_color,
        static_cast<uint8_t>(kDividerTopAlpha - kDividerAlphaStep * row));
    for (int32_t x = px0; x < px1; ++x) {
      float overlap = std::min(x1, x + 1.0f) - std::max(x0, static_cast<float>(x));
      if (overlap > 0.0f) {
        Color::blend_pixel(canvas.pixel(x, y), color, overlap);
      }
    }
  }

  // A rounded rectangle whose radius is half its side is a circle
  RectangleOutline dot_shape(kDotRadius);
  RGBA dot_color = Color::with_alpha(theme.text_color, kDotAlpha);
  for (float cx : {x0 - kDotGap, x1 + kDotGap}) {
    RectF dot{cx - kDotRadius, divider.center_y - kDotRadius, 2.0f * kDotRadius,
              2.0f * kDotRadius};
    CoverageMask mask = CoverageMask::rasterize(dot_shape.generate(dot),
                                                canvas.width, canvas.height);
    fill_solid(canvas, mask, dot_color);
  }
}

void PanelRenderer::apply_backdrop(ImageBuffer &canvas,
                                   const ThemeSpec &theme) const {
  if (theme.backdrop_blur > 0.0f) {
    RectI all{0, 0, static_cast<int32_t>(canvas.width),
              static_cast<int32_t>(canvas.height)};
    gaussian_blur(canvas, all, theme.backdrop_blur);
  }
  if (theme.backdrop_brightness != 1.0f) {
    scale_brightness(canvas, theme.backdrop_brightness);
  }
}

} // namespace WordCard
