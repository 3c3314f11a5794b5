/**
 * @file layout_tests.cpp
 * @brief Wrapping, font fitting and panel placement
 *
 * Box glyphs make every width exact: Latin advances 0.6 em, CJK 1.0 em,
 * a space 0.3 em, and a line is 1.0 em tall.
 */

#include "card/layout.hpp"
#include "card/outline.hpp"
#include "test_support.hpp"
#include "text/utf8.hpp"
#include "testing/card_test.hpp"

#include <cmath>

using namespace WordCard;
using namespace WordCard::Testing;

namespace {

bool near(float a, float b, float eps = 1e-3f) { return std::fabs(a - b) <= eps; }

bool same_rect(const Math::RectF &a, const Math::RectF &b) {
  return near(a.x, b.x) && near(a.y, b.y) && near(a.width, b.width) &&
         near(a.height, b.height);
}

LayoutRequest request_for(uint32_t w, uint32_t h, std::string english,
                          std::string chinese) {
  LayoutRequest request;
  request.canvas = {w, h};
  request.english = std::move(english);
  request.chinese = std::move(chinese);
  return request;
}

} // namespace

WC_TEST(layout, basic_card_geometry) {
  LayoutEngine engine(box_fonts());
  auto layout = engine.compute(request_for(1000, 800, "apple", "苹果"));
  WC_REQUIRE(layout.has_value());

  // English 5 x 36 = 180 wide, 60 tall; 18px gap; Chinese 45 tall
  WC_EXPECT(same_rect(layout->text_rect, {410.0f, 338.5f, 180.0f, 123.0f}));
  WC_EXPECT(same_rect(layout->panel_rect, {370.0f, 298.5f, 260.0f, 203.0f}));
  WC_EXPECT_EQ(layout->size_en, 60u);
  WC_EXPECT_EQ(layout->size_cn, 45u);
  WC_EXPECT_EQ(layout->global_scale, 1.0f);

  WC_REQUIRE(layout->lines.size() == 2);
  const LayoutLine &en = layout->lines[0];
  const LayoutLine &cn = layout->lines[1];
  WC_EXPECT(en.role == Text::TextRole::English);
  WC_EXPECT(en.text == U"apple");
  WC_EXPECT(near(en.baseline.x, 410.0f));
  WC_EXPECT(near(en.baseline.y, 338.5f + 48.0f));
  WC_EXPECT(cn.role == Text::TextRole::Chinese);
  WC_EXPECT(near(cn.width, 90.0f));
  WC_EXPECT(near(cn.baseline.x, 455.0f));
  WC_EXPECT(near(cn.baseline.y, 338.5f + 78.0f + 36.0f));

  WC_REQUIRE(layout->divider.has_value());
  WC_EXPECT(near(layout->divider->width, 200.0f));
  WC_EXPECT(near(layout->divider->center_x, 500.0f));
  WC_EXPECT(near(layout->divider->center_y, 338.5f + 69.0f));
}

WC_TEST(layout, block_is_centered) {
  LayoutEngine engine(box_fonts());
  for (ThemeName theme : kAllThemes) {
    for (BackgroundShape shape : kAllShapes) {
      LayoutRequest request = request_for(1080, 1920, "elephant", "大象");
      request.theme = theme_spec(theme);
      request.shape = shape;
      request.font_scale = 1.15f;
      auto layout = engine.compute(request);
      WC_REQUIRE(layout.has_value());
      WC_EXPECT(near(layout->text_rect.center_x(), 540.0f));
      WC_EXPECT(near(layout->text_rect.center_y(), 960.0f));
      WC_EXPECT(near(layout->panel_rect.center_x(), 540.0f));
      WC_EXPECT(near(layout->panel_rect.center_y(), 960.0f));
      WC_EXPECT(layout->panel_rect.contains(layout->text_rect));
      WC_EXPECT_EQ(layout->size_en, 69u);
    }
  }
}

WC_TEST(layout, phonetic_line) {
  LayoutEngine engine(box_fonts());
  LayoutRequest request = request_for(1000, 800, "apple", "苹果");
  request.phonetic = "/ˈæp.əl/";
  auto layout = engine.compute(request);
  WC_REQUIRE(layout.has_value());

  WC_REQUIRE(layout->lines.size() == 3);
  WC_EXPECT(layout->lines[0].role == Text::TextRole::English);
  WC_EXPECT(layout->lines[1].role == Text::TextRole::Phonetic);
  WC_EXPECT(layout->lines[2].role == Text::TextRole::Chinese);
  WC_EXPECT_EQ(layout->size_phonetic, 18u);
  WC_EXPECT(layout->lines[0].baseline.y < layout->lines[1].baseline.y);
  WC_EXPECT(layout->lines[1].baseline.y < layout->lines[2].baseline.y);
  // 60 + 3.6 + 18 + 18 + 45
  WC_EXPECT(near(layout->text_rect.height, 144.6f));
}

WC_TEST(layout, long_word_shrinks) {
  LayoutEngine engine(box_fonts());
  // 15 letters at 0.6 em must fit 0.8 * 600 = 480px: 53px is the largest
  auto layout = engine.compute(request_for(600, 1200, "extraordinarily", "非常"));
  WC_REQUIRE(layout.has_value());
  WC_EXPECT_EQ(layout->size_en, 53u);
  WC_REQUIRE(!layout->lines.empty());
  WC_EXPECT(layout->lines[0].text == U"extraordinarily");
  WC_EXPECT(layout->lines[0].width <= 480.0f);
}

WC_TEST(layout, very_long_word_breaks_at_floor) {
  LayoutEngine engine(box_fonts());
  const std::string word = "pneumonoultramicroscopicsilicovolcanoconiosis";
  auto layout = engine.compute(request_for(400, 1200, word, "肺尘病"));
  WC_REQUIRE(layout.has_value());

  WC_EXPECT_EQ(layout->size_en, 30u);
  std::u32string joined;
  size_t english_lines = 0;
  for (const LayoutLine &line : layout->lines) {
    WC_EXPECT(line.width <= 400.0f);
    WC_EXPECT(line.baseline.x >= 0.0f);
    WC_EXPECT(line.baseline.x + line.width <= 400.0f);
    if (line.role == Text::TextRole::English) {
      joined += line.text;
      ++english_lines;
    }
  }
  WC_EXPECT(english_lines > 1);
  WC_EXPECT(joined == Text::utf8_to_u32(word));
  WC_EXPECT(layout->panel_rect.left() >= 0.0f);
  WC_EXPECT(layout->panel_rect.right() <= 400.0f);
}

WC_TEST(layout, wraps_at_spaces) {
  LayoutEngine engine(box_fonts());
  const std::string phrase = "the quick brown fox jumps over the lazy dog";
  auto layout = engine.compute(request_for(1000, 800, phrase, "狐狸"));
  WC_REQUIRE(layout.has_value());
  WC_EXPECT_EQ(layout->size_en, 60u);

  std::u32string joined;
  size_t english_lines = 0;
  for (const LayoutLine &line : layout->lines) {
    if (line.role != Text::TextRole::English) {
      continue;
    }
    WC_EXPECT(line.width <= 800.0f);
    WC_EXPECT(line.text.front() != U' ' && line.text.back() != U' ');
    if (!joined.empty()) {
      joined += U' ';
    }
    joined += line.text;
    ++english_lines;
  }
  WC_EXPECT_EQ(english_lines, 2u);
  WC_EXPECT(joined == Text::utf8_to_u32(phrase));
}

WC_TEST(layout, wraps_between_ideographs) {
  LayoutEngine engine(box_fonts());
  const std::string chinese = "一二三四五六七八九十百千万亿天地人和风雨";
  auto layout = engine.compute(request_for(1000, 800, "numbers", chinese));
  WC_REQUIRE(layout.has_value());
  WC_EXPECT_EQ(layout->size_cn, 45u);

  std::vector<const LayoutLine *> cn_lines;
  for (const LayoutLine &line : layout->lines) {
    if (line.role == Text::TextRole::Chinese) {
      cn_lines.push_back(&line);
    }
  }
  WC_REQUIRE(cn_lines.size() == 2);
  WC_EXPECT_EQ(cn_lines[0]->text.size(), 17u);
  WC_EXPECT_EQ(cn_lines[1]->text.size(), 3u);
}

WC_TEST(layout, wrap_field_directly) {
  LayoutEngine engine(box_fonts());
  auto field = engine.wrap_field(U"abc def", Text::TextRole::English, 10, 30.0f);
  WC_REQUIRE(field.has_value());
  // "abc def" is 39px wide at 10px, each word 18px
  WC_EXPECT_EQ(field->font_size, 10u);
  WC_REQUIRE(field->lines.size() == 2);
  WC_EXPECT(field->lines[0] == U"abc");
  WC_EXPECT(field->lines[1] == U"def");

  auto width = engine.measure(U"abc def", Text::TextRole::English, 10);
  WC_REQUIRE(width.has_value());
  WC_EXPECT(near(*width, 39.0f));
}

WC_TEST(layout, uncovered_code_point_fails) {
  LayoutEngine engine(box_fonts());
  auto layout = engine.compute(request_for(1000, 800, "สวัสดี", "你好"));
  WC_REQUIRE(!layout.has_value());
  WC_EXPECT(layout.error().code == CardErrorCode::RenderFailure);
}

WC_TEST(layout, wave_panel_is_taller) {
  LayoutEngine engine(box_fonts());
  LayoutRequest request = request_for(1000, 800, "apple", "苹果");
  auto rect = engine.compute(request);
  request.shape = BackgroundShape::Wave;
  auto wave = engine.compute(request);
  WC_REQUIRE(rect.has_value() && wave.has_value());

  WC_EXPECT(same_rect(rect->text_rect, wave->text_rect));
  WC_EXPECT(near(wave->panel_rect.width, rect->panel_rect.width));
  WC_EXPECT(near(wave->panel_rect.height,
                 rect->panel_rect.height + 4.0f * kWaveAmplitude));
}

WC_TEST(layout, minimal_theme_has_no_padding) {
  LayoutEngine engine(box_fonts());
  for (BackgroundShape shape : kAllShapes) {
    LayoutRequest request = request_for(1000, 800, "apple", "苹果");
    request.theme = theme_spec(ThemeName::Minimal);
    request.shape = shape;
    auto layout = engine.compute(request);
    WC_REQUIRE(layout.has_value());
    WC_EXPECT(same_rect(layout->panel_rect, layout->text_rect));
    WC_EXPECT(!layout->divider.has_value());
  }
}

WC_TEST(layout, elegant_padding_is_widest) {
  LayoutEngine engine(box_fonts());
  LayoutRequest request = request_for(1000, 800, "apple", "苹果");
  request.theme = theme_spec(ThemeName::Elegant);
  auto elegant = engine.compute(request);
  request.theme = theme_spec(ThemeName::Standard);
  auto standard = engine.compute(request);
  WC_REQUIRE(elegant.has_value() && standard.has_value());
  WC_EXPECT(elegant->panel_rect.width > standard->panel_rect.width);
}

WC_TEST(layout, panel_stays_inside_canvas) {
  LayoutEngine engine(box_fonts());
  // 468px of text plus 80px padding against a 568px margin box
  LayoutRequest request = request_for(600, 400, "encyclopaedic", "百科全书的");
  auto layout = engine.compute(request);
  WC_REQUIRE(layout.has_value());
  WC_EXPECT(layout->panel_rect.left() >= 0.0f);
  WC_EXPECT(layout->panel_rect.top() >= 0.0f);
  WC_EXPECT(layout->panel_rect.right() <= 600.0f);
  WC_EXPECT(layout->panel_rect.bottom() <= 400.0f);
  WC_EXPECT(layout->panel_rect.contains(layout->text_rect));
  if (layout->divider) {
    WC_EXPECT(layout->divider->width <= layout->panel_rect.width);
  }
}

WC_TEST(layout, degenerate_inputs) {
  LayoutEngine engine(box_fonts());

  auto tiny = engine.compute(request_for(100, 60, "apple", "苹果"));
  WC_REQUIRE(!tiny.has_value());
  WC_EXPECT(tiny.error().code == CardErrorCode::InvalidGeometry);

  auto empty_canvas = engine.compute(request_for(0, 800, "apple", "苹果"));
  WC_REQUIRE(!empty_canvas.has_value());
  WC_EXPECT(empty_canvas.error().code == CardErrorCode::InvalidGeometry);

  LayoutRequest zero_size = request_for(1000, 800, "apple", "苹果");
  zero_size.size_en = 0;
  auto zero = engine.compute(zero_size);
  WC_REQUIRE(!zero.has_value());
  WC_EXPECT(zero.error().code == CardErrorCode::InvalidGeometry);

  auto blank = engine.compute(request_for(1000, 800, "   ", ""));
  WC_REQUIRE(!blank.has_value());
  WC_EXPECT(blank.error().code == CardErrorCode::InvalidGeometry);
}
