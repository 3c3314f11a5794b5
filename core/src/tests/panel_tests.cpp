/**
 * @file panel_tests.cpp
 * @brief Panel shapes, fills, decorations and backdrop effects
 */

#include "card/outline.hpp"
#include "card/panel_renderer.hpp"
#include "test_support.hpp"
#include "testing/card_test.hpp"

#include <cmath>
#include <limits>

using namespace WordCard;
using namespace WordCard::Testing;

namespace {

constexpr uint8_t kGray = 120;
const Math::RectF kPanel{200.0f, 150.0f, 400.0f, 300.0f};

ImageBuffer gray_canvas() { return solid_image(800, 600, kGray, kGray, kGray); }

bool is_gray(const uint8_t *p) {
  return p[0] == kGray && p[1] == kGray && p[2] == kGray;
}

} // namespace

WC_TEST(panel, fill_stays_inside_panel_bounds) {
  PanelRenderer renderer;
  const Math::RectI inside = Math::pixel_bounds(kPanel, 800, 600);

  for (ThemeName name : kAllThemes) {
    for (BackgroundShape shape : kAllShapes) {
      ImageBuffer canvas = gray_canvas();
      auto drawn =
          renderer.draw(canvas, kPanel, theme_spec(name), BackgroundStyle{shape});
      WC_REQUIRE(drawn.has_value());

      size_t changed = 0;
      size_t escaped = 0;
      for (uint32_t y = 0; y < canvas.height; ++y) {
        for (uint32_t x = 0; x < canvas.width; ++x) {
          if (is_gray(canvas.pixel(x, y))) {
            continue;
          }
          ++changed;
          bool in_bounds = static_cast<int32_t>(x) >= inside.x &&
                           static_cast<int32_t>(x) < inside.x + inside.width &&
                           static_cast<int32_t>(y) >= inside.y &&
                           static_cast<int32_t>(y) < inside.y + inside.height;
          if (!in_bounds) {
            ++escaped;
          }
        }
      }

      WC_EXPECT_EQ(escaped, 0u);
      if (name == ThemeName::Minimal) {
        WC_EXPECT_EQ(changed, 0u);
      } else {
        WC_EXPECT(changed > 0);
      }
    }
  }
}

WC_TEST(panel, solid_fill_value) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  auto drawn = renderer.draw(canvas, kPanel, theme_spec(ThemeName::Standard),
                             BackgroundStyle{});
  WC_REQUIRE(drawn.has_value());

  // Black at alpha 128 over 120
  const uint8_t *center = canvas.pixel(400, 300);
  WC_EXPECT_EQ(static_cast<int>(center[0]), 60);
  WC_EXPECT_EQ(static_cast<int>(center[1]), 60);
  WC_EXPECT_EQ(static_cast<int>(center[2]), 60);
}

WC_TEST(panel, rounded_corners_skip_the_corner_pixel) {
  PanelRenderer renderer;

  ImageBuffer rounded = gray_canvas();
  WC_REQUIRE(renderer
                 .draw(rounded, kPanel, theme_spec(ThemeName::Standard),
                       BackgroundStyle{})
                 .has_value());
  WC_EXPECT(is_gray(rounded.pixel(200, 150)));
  WC_EXPECT(is_gray(rounded.pixel(599, 449)));
  WC_EXPECT(!is_gray(rounded.pixel(400, 150)));

  ImageBuffer square = gray_canvas();
  WC_REQUIRE(renderer
                 .draw(square, kPanel, theme_spec(ThemeName::Dark),
                       BackgroundStyle{})
                 .has_value());
  WC_EXPECT(!is_gray(square.pixel(200, 150)));
  WC_EXPECT(!is_gray(square.pixel(599, 449)));
}

WC_TEST(panel, gradient_darkens_toward_top) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  WC_REQUIRE(renderer
                 .draw(canvas, kPanel, theme_spec(ThemeName::Elegant),
                       BackgroundStyle{})
                 .has_value());

  const uint8_t *top = canvas.pixel(400, 160);
  const uint8_t *bottom = canvas.pixel(400, 440);
  WC_EXPECT(top[0] < bottom[0]);
  WC_EXPECT(bottom[0] < kGray);
}

WC_TEST(panel, blurred_fill_on_flat_background) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  WC_REQUIRE(renderer
                 .draw(canvas, kPanel, theme_spec(ThemeName::Focus),
                       BackgroundStyle{})
                 .has_value());

  // Blurring a flat image changes nothing; only the overlay shows
  const uint8_t *center = canvas.pixel(400, 300);
  const int expected =
      static_cast<int>(20 * (90 / 255.0f) + kGray * (1.0f - 90 / 255.0f) + 0.5f);
  WC_EXPECT(std::abs(center[0] - expected) <= 1);
}

WC_TEST(panel, wave_outline_is_symmetric) {
  const Math::RectF rect{100.0f, 100.0f, 300.0f, 200.0f};
  WaveOutline wave;
  Outline outline = wave.generate(rect);
  CoverageMask mask = CoverageMask::rasterize(outline, 800, 600);
  WC_REQUIRE(!mask.bounds().empty());

  // Mirror axis x = 250: pixel px maps to 499 - px
  float worst = 0.0f;
  for (int32_t y = 95; y < 305; ++y) {
    for (int32_t x = 100; x < 250; ++x) {
      worst = std::max(worst, std::fabs(mask.at(x, y) - mask.at(499 - x, y)));
    }
  }
  WC_EXPECT(worst <= 1e-3f);

  // Crest on the center line touches the rectangle's top
  WC_EXPECT(std::fabs(wave.top_edge(rect, 250.0f) - rect.top()) < 1e-4f);
  for (const Math::Vec2f &p : outline.points) {
    WC_EXPECT(p.x >= rect.left() - 1e-3f && p.x <= rect.right() + 1e-3f);
    WC_EXPECT(p.y >= rect.top() - 1e-3f && p.y <= rect.bottom() + 1e-3f);
  }
}

WC_TEST(panel, wave_amplitude_is_clamped_for_short_panels) {
  const Math::RectF flat{0.0f, 0.0f, 300.0f, 20.0f};
  WaveOutline wave;
  float lowest = flat.top();
  for (float x = 0.0f; x <= 300.0f; x += 1.0f) {
    lowest = std::max(lowest, wave.top_edge(flat, x));
  }
  // Amplitude min(14, 20 / 4) = 5: troughs at most 10px below the top
  WC_EXPECT(lowest <= 10.0f + 1e-3f);
  WC_EXPECT(lowest > 9.0f);
}

WC_TEST(panel, coverage_is_exact_at_edges) {
  RectangleOutline square;
  Outline outline = square.generate({10.5f, 10.0f, 20.0f, 10.0f});
  CoverageMask mask = CoverageMask::rasterize(outline, 64, 64);

  WC_EXPECT(std::fabs(mask.at(15, 12) - 1.0f) < 1e-4f);
  WC_EXPECT(std::fabs(mask.at(10, 12) - 0.5f) < 1e-4f);
  WC_EXPECT(std::fabs(mask.at(30, 12) - 0.5f) < 1e-4f);
  WC_EXPECT_EQ(mask.at(9, 12), 0.0f);
  WC_EXPECT_EQ(mask.at(15, 20), 0.0f);
  WC_EXPECT_EQ(mask.at(-1, -1), 0.0f);
}

WC_TEST(panel, outline_generator_choice) {
  auto standard = make_outline_generator(BackgroundShape::Rectangle,
                                         theme_spec(ThemeName::Standard));
  auto dark = make_outline_generator(BackgroundShape::Rectangle,
                                     theme_spec(ThemeName::Dark));
  auto wave = make_outline_generator(BackgroundShape::Wave,
                                     theme_spec(ThemeName::Standard));
  WC_EXPECT(standard->name() == "rounded-rectangle");
  WC_EXPECT(dark->name() == "rectangle");
  WC_EXPECT(wave->name() == "wave");
}

WC_TEST(panel, degenerate_rect_is_invalid_geometry) {
  PanelRenderer renderer;
  const ThemeSpec &theme = theme_spec(ThemeName::Standard);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const Math::RectF bad_rects[] = {{100.0f, 100.0f, 0.0f, 50.0f},
                                   {100.0f, 100.0f, 50.0f, -5.0f},
                                   {100.0f, 100.0f, nan, 50.0f},
                                   {nan, 100.0f, 50.0f, 50.0f}};
  for (const Math::RectF &rect : bad_rects) {
    ImageBuffer canvas = gray_canvas();
    auto drawn = renderer.draw(canvas, rect, theme, BackgroundStyle{});
    WC_REQUIRE(!drawn.has_value());
    WC_EXPECT(drawn.error().code == CardErrorCode::InvalidGeometry);
  }

  // Minimal draws nothing but still rejects a degenerate panel
  ImageBuffer canvas = gray_canvas();
  auto minimal = renderer.draw(canvas, bad_rects[0],
                               theme_spec(ThemeName::Minimal), BackgroundStyle{});
  WC_EXPECT(!minimal.has_value());
}

WC_TEST(panel, divider_fades_downward) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  renderer.draw_decorations(canvas, DividerPlacement{400.0f, 300.0f, 200.0f},
                            theme_spec(ThemeName::Standard));

  // White rows at alpha 150, 120, 90, 60, 30 from y = 298
  int previous = 256;
  for (uint32_t y = 298; y <= 302; ++y) {
    int value = canvas.pixel(400, y)[0];
    WC_EXPECT(value > kGray);
    WC_EXPECT(value < previous);
    previous = value;
  }
  WC_EXPECT(is_gray(canvas.pixel(400, 297)));
  WC_EXPECT(is_gray(canvas.pixel(400, 303)));
  WC_EXPECT(is_gray(canvas.pixel(299, 300)));
  WC_EXPECT(!is_gray(canvas.pixel(300, 300)));

  // Dots 15px outside each end
  WC_EXPECT(!is_gray(canvas.pixel(285, 300)));
  WC_EXPECT(!is_gray(canvas.pixel(514, 300)));
  WC_EXPECT(is_gray(canvas.pixel(292, 300)));
}

WC_TEST(panel, decorations_follow_the_theme) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  renderer.draw_decorations(canvas, DividerPlacement{400.0f, 300.0f, 200.0f},
                            theme_spec(ThemeName::Minimal));
  WC_EXPECT(is_gray(canvas.pixel(400, 298)));
  WC_EXPECT(is_gray(canvas.pixel(285, 300)));
}

WC_TEST(panel, backdrop_dims_the_canvas) {
  PanelRenderer renderer;
  ImageBuffer canvas = gray_canvas();
  renderer.apply_backdrop(canvas, theme_spec(ThemeName::Dark));

  bool dimmed = true;
  for (size_t i = 0; i < canvas.data.size(); i += 4) {
    dimmed = dimmed && std::abs(canvas.data[i] - 60) <= 1;
  }
  WC_EXPECT(dimmed);

  ImageBuffer untouched = gray_canvas();
  renderer.apply_backdrop(untouched, theme_spec(ThemeName::Standard));
  WC_EXPECT(untouched.data == gray_canvas().data);
}
