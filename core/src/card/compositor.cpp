/**
 * @file compositor.cpp
 * @brief Card compositing pipeline
 */

#include "card/compositor.hpp"

namespace WordCard {

CardCompositor::CardCompositor(Text::FontSet fonts)
    : layoutEngine_(fonts), textRenderer_(fonts) {}

CardResult<CardLayout> CardCompositor::layout(const RenderJob &job,
                                              const CanvasSize &canvas) const {
  LayoutRequest request;
  request.canvas = canvas;
  request.english = job.word.english;
  request.chinese = job.word.chinese;
  request.phonetic = job.phonetic;
  request.size_en = job.fonts.size_en;
  request.size_cn = job.fonts.size_cn;
  request.size_phonetic = job.fonts.effective_phonetic_size();
  request.font_scale = job.device.font_scale;
  request.theme = job.theme;
  request.shape = job.style.shape;
  return layoutEngine_.compute(request);
}

CardResult<ImageBuffer> CardCompositor::render(const RenderJob &job) const {
  if (!job.background || job.background->empty()) {
    return make_error(CardErrorCode::RenderFailure, "Background image is empty");
  }

  ImageBuffer canvas = fit_to_device(*job.background, job.device);
  const CanvasSize size{canvas.width, canvas.height};

  auto card_layout = layout(job, size);
  if (!card_layout) {
    return card_layout.error();
  }

  if (job.backdrop_effects) {
    panelRenderer_.apply_backdrop(canvas, job.theme);
  }

  auto panel =
      panelRenderer_.draw(canvas, card_layout->panel_rect, job.theme, job.style);
  if (!panel) {
    return panel.error();
  }

  if (card_layout->divider) {
    panelRenderer_.draw_decorations(canvas, *card_layout->divider, job.theme);
  }

  auto text = textRenderer_.draw(canvas, *card_layout, job.theme);
  if (!text) {
    return text.error();
  }
  return canvas;
}

} // namespace WordCard
