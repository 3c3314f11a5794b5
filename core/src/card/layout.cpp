/**
 * @file layout.cpp
 * @brief Layout engine implementation
 */

#include "card/layout.hpp"
#include "card/outline.hpp"
#include "text/shaper.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <cmath>

namespace WordCard {

using Math::RectF;
using Text::TextRole;

namespace {

/// Smallest unit that wrapping keeps on one line
struct BreakToken {
  std::u32string text;
  bool space_before = false;
};

/// Latin words split at spaces, every CJK code point is its own token
std::vector<BreakToken> tokenize(std::u32string_view text) {
  std::vector<BreakToken> tokens;
  std::u32string current;
  bool pending_space = false;

  auto flush = [&]() {
    if (!current.empty()) {
      tokens.push_back({current, pending_space});
      current.clear();
      pending_space = false;
    }
  };

  for (char32_t cp : text) {
    if (Text::is_space(cp)) {
      flush();
      pending_space = !tokens.empty();
    } else if (Text::is_cjk(cp)) {
      flush();
      tokens.push_back({std::u32string(1, cp), pending_space});
      pending_space = false;
    } else {
      current.push_back(cp);
    }
  }
  flush();
  return tokens;
}

uint32_t scaled_size(uint32_t size, float scale) {
  auto scaled = static_cast<uint32_t>(std::lround(size * scale));
  return std::max<uint32_t>(scaled, 1);
}

bool fits(const RectF &rect, const RectF &box) {
  constexpr float kEpsilon = 1e-3f;
  return rect.width <= box.width + kEpsilon &&
         rect.height <= box.height + kEpsilon;
}

RectF margin_box(const CanvasSize &canvas) {
  float margin = kMarginRatio * static_cast<float>(std::min(canvas.width,
                                                            canvas.height));
  return {margin, margin, canvas.width - 2.0f * margin,
          canvas.height - 2.0f * margin};
}

/// Divider spans at most the panel minus room for the two dots
std::optional<DividerPlacement> place_divider(const LayoutRequest &request,
                                              const CardLayout &layout,
                                              float divider_y) {
  float width = std::min(kDividerMaxRatio * request.canvas.width,
                         kDividerMaxWidth * request.font_scale);
  float room = layout.panel_rect.width - 2.0f * (kDotGap + kDotRadius) - 2.0f;
  width = std::min(width, room);
  if (width < 2.0f * kDotRadius) {
    return std::nullopt;
  }
  return DividerPlacement{layout.panel_rect.center_x(), divider_y, width};
}

} // anonymous namespace

LayoutEngine::LayoutEngine(Text::FontSet fonts) : fonts_(std::move(fonts)) {}

CardResult<float> LayoutEngine::measure(std::u32string_view text,
                                        TextRole role,
                                        uint32_t pixel_size) const {
  auto shaped = Text::shape_line(text, role, fonts_, pixel_size);
  if (!shaped) {
    return shaped.error();
  }
  return shaped->width;
}

CardResult<std::vector<std::u32string>>
LayoutEngine::wrap_lines(std::u32string_view text, TextRole role,
                         uint32_t size, float max_width,
                         bool break_words) const {
  std::vector<std::u32string> lines;
  std::u32string line;

  for (const BreakToken &token : tokenize(text)) {
    std::u32string candidate = line;
    if (!candidate.empty() && token.space_before) {
      candidate.push_back(U' ');
    }
    candidate += token.text;

    auto width = measure(candidate, role, size);
    if (!width) {
      return width.error();
    }
    if (*width <= max_width) {
      line = std::move(candidate);
      continue;
    }

    if (!line.empty()) {
      lines.push_back(std::move(line));
      line.clear();

      auto alone = measure(token.text, role, size);
      if (!alone) {
        return alone.error();
      }
      if (*alone <= max_width) {
        line = token.text;
        continue;
      }
    }

    if (!break_words) {
      // Overflowing word on its own line; the caller shrinks the font
      line = token.text;
      continue;
    }

    for (char32_t cp : token.text) {
      std::u32string extended = line;
      extended.push_back(cp);
      auto w = measure(extended, role, size);
      if (!w) {
        return w.error();
      }
      if (line.empty() || *w <= max_width) {
        line = std::move(extended);
      } else {
        lines.push_back(std::move(line));
        line = std::u32string(1, cp);
      }
    }
  }

  if (!line.empty()) {
    lines.push_back(std::move(line));
  }
  return lines;
}

CardResult<LayoutEngine::WrappedField>
LayoutEngine::wrap_field(std::u32string_view text, TextRole role,
                         uint32_t base_size, float max_width,
                         float start_scale) const {
  const auto floor_size = std::max<uint32_t>(
      1, static_cast<uint32_t>(std::ceil(base_size * kMinFieldScale)));
  const uint32_t start_size =
      std::max(floor_size, scaled_size(base_size, start_scale));

  auto measure_all = [&](WrappedField &field) -> CardResult<bool> {
    bool all_fit = true;
    field.widths.clear();
    for (const auto &line : field.lines) {
      auto w = measure(line, role, field.font_size);
      if (!w) {
        return w.error();
      }
      field.widths.push_back(*w);
      all_fit = all_fit && *w <= max_width;
    }
    return all_fit;
  };

  for (uint32_t size = start_size; size >= floor_size; --size) {
    auto lines = wrap_lines(text, role, size, max_width, false);
    if (!lines) {
      return lines.error();
    }
    WrappedField field;
    field.font_size = size;
    field.lines = std::move(*lines);
    auto all_fit = measure_all(field);
    if (!all_fit) {
      return all_fit.error();
    }
    if (*all_fit) {
      return field;
    }
    if (size == 1) {
      break;
    }
  }

  // Still overflowing at the floor: break words between characters
  auto lines = wrap_lines(text, role, floor_size, max_width, true);
  if (!lines) {
    return lines.error();
  }
  WrappedField field;
  field.font_size = floor_size;
  field.lines = std::move(*lines);
  auto all_fit = measure_all(field);
  if (!all_fit) {
    return all_fit.error();
  }
  return field;
}

CardResult<CardLayout> LayoutEngine::try_layout(const LayoutRequest &request,
                                                float global_scale) const {
  const float scale = request.font_scale * global_scale;
  const float canvas_w = static_cast<float>(request.canvas.width);
  const float canvas_h = static_cast<float>(request.canvas.height);
  const float max_width = canvas_w * kWrapWidthRatio;

  CardLayout layout;
  layout.global_scale = global_scale;

  // Rows relative to the top of the text block
  struct Row {
    std::u32string text;
    TextRole role;
    uint32_t size;
    float width;
    float baseline_y;
  };
  std::vector<Row> rows;
  float y = 0.0f;
  float block_width = 0.0f;

  auto place_group = [&](const WrappedField &field, TextRole role) {
    Text::FaceMetrics m = fonts_.line_metrics(field.font_size);
    for (size_t i = 0; i < field.lines.size(); ++i) {
      if (i > 0) {
        y += kInnerLineGap * field.font_size;
      }
      rows.push_back({field.lines[i], role, field.font_size, field.widths[i],
                      y + m.ascent});
      y += m.ascent + m.descent;
      block_width = std::max(block_width, field.widths[i]);
    }
  };

  auto english = wrap_field(Text::utf8_to_u32(request.english),
                            TextRole::English,
                            scaled_size(request.size_en, request.font_scale),
                            max_width, global_scale);
  if (!english) {
    return english.error();
  }
  layout.size_en = english->font_size;
  place_group(*english, TextRole::English);

  if (request.phonetic && !request.phonetic->empty()) {
    auto phonetic = wrap_field(
        Text::utf8_to_u32(*request.phonetic), TextRole::Phonetic,
        scaled_size(request.size_phonetic, request.font_scale), max_width,
        global_scale);
    if (!phonetic) {
      return phonetic.error();
    }
    layout.size_phonetic = phonetic->font_size;
    if (!rows.empty()) {
      y += kPhoneticGap * phonetic->font_size;
    }
    place_group(*phonetic, TextRole::Phonetic);
  }

  auto chinese = wrap_field(Text::utf8_to_u32(request.chinese),
                            TextRole::Chinese,
                            scaled_size(request.size_cn, request.font_scale),
                            max_width, global_scale);
  if (!chinese) {
    return chinese.error();
  }
  layout.size_cn = chinese->font_size;

  std::optional<float> divider_rel_y;
  if (!chinese->lines.empty() && !rows.empty()) {
    float gap = kChineseGap * chinese->font_size;
    divider_rel_y = y + gap * 0.5f;
    y += gap;
  }
  place_group(*chinese, TextRole::Chinese);

  const float block_height = y;
  if (rows.empty() || block_width <= 0.0f || block_height <= 0.0f) {
    return make_error(CardErrorCode::InvalidGeometry,
                      "Nothing to lay out: empty text");
  }

  layout.text_rect = {(canvas_w - block_width) * 0.5f,
                      (canvas_h - block_height) * 0.5f, block_width,
                      block_height};

  for (Row &row : rows) {
    LayoutLine line;
    line.role = row.role;
    line.font_size = row.size;
    line.color = request.theme.text_color;
    line.width = row.width;
    line.baseline = {layout.text_rect.center_x() - row.width * 0.5f,
                     layout.text_rect.top() + row.baseline_y};
    line.text = std::move(row.text);
    layout.lines.push_back(std::move(line));
  }

  float padding = request.theme.padding * scale;
  float wave_allowance = 0.0f;
  if (request.shape == BackgroundShape::Wave && request.theme.draws_panel()) {
    wave_allowance = 2.0f * kWaveAmplitude;
  }
  layout.panel_rect =
      layout.text_rect.expanded(padding, padding + wave_allowance);

  if (request.theme.decoration && divider_rel_y) {
    layout.divider = place_divider(request, layout,
                                   layout.text_rect.top() + *divider_rel_y);
  }
  return layout;
}

CardResult<CardLayout> LayoutEngine::compute(const LayoutRequest &request) const {
  if (request.canvas.width == 0 || request.canvas.height == 0) {
    return make_error(CardErrorCode::InvalidGeometry,
                      "Canvas has zero size");
  }
  if (request.size_en == 0 || request.size_cn == 0 ||
      request.size_phonetic == 0 || !(request.font_scale > 0.0f)) {
    return make_error(CardErrorCode::InvalidGeometry,
                      "Font sizes and scale must be positive");
  }

  const RectF box = margin_box(request.canvas);
  const int steps = static_cast<int>(
      std::lround((1.0f - kMinGlobalScale) / kGlobalShrinkStep));

  std::optional<CardLayout> smallest;
  for (int step = 0; step <= steps; ++step) {
    float global_scale = 1.0f - kGlobalShrinkStep * step;
    auto layout = try_layout(request, global_scale);
    if (!layout) {
      return layout.error();
    }
    if (fits(layout->panel_rect, box)) {
      return std::move(*layout);
    }
    smallest = std::move(*layout);
  }

  CardLayout &layout = *smallest;
  if (!fits(layout.text_rect, box)) {
    return make_error(
        CardErrorCode::InvalidGeometry,
        "Text block " + std::to_string(static_cast<int>(layout.text_rect.width)) +
            "x" + std::to_string(static_cast<int>(layout.text_rect.height)) +
            " does not fit a " + std::to_string(request.canvas.width) + "x" +
            std::to_string(request.canvas.height) + " canvas");
  }

  layout.panel_rect = layout.panel_rect.intersected(box);
  if (layout.divider) {
    float room = layout.panel_rect.width - 2.0f * (kDotGap + kDotRadius) - 2.0f;
    layout.divider->width = std::min(layout.divider->width, room);
    if (layout.divider->width < 2.0f * kDotRadius) {
      layout.divider.reset();
    }
  }
  return std::move(layout);
}

} // namespace WordCard
