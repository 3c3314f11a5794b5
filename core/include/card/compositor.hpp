#pragma once
/**
 * @file compositor.hpp
 * @brief One word card: background fit, backdrop, panel, decorations, text
 */

#include "card/config.hpp"
#include "card/device_profile.hpp"
#include "card/layout.hpp"
#include "card/panel_renderer.hpp"
#include "card/text_renderer.hpp"
#include "card/theme.hpp"
#include "card/word_list.hpp"
#include "core/image_buffer.hpp"
#include "core/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace WordCard {

/// Everything needed to render one card
struct RenderJob {
  WordEntry word;
  std::optional<std::string> phonetic;
  std::shared_ptr<const ImageBuffer> background;
  DeviceProfile device;
  ThemeSpec theme = theme_spec(ThemeName::Standard);
  BackgroundStyle style;
  FontSpec fonts;
  bool backdrop_effects = false;
};

/**
 * @brief Renders RenderJobs into flattened RGBA canvases
 *
 * Z-order: fitted background, optional backdrop effects, panel,
 * decorations, text shadow or stroke, text.
 */
class CardCompositor {
public:
  explicit CardCompositor(Text::FontSet fonts);

  [[nodiscard]] CardResult<ImageBuffer> render(const RenderJob &job) const;

  /// Layout the job would use, without drawing
  [[nodiscard]] CardResult<CardLayout> layout(const RenderJob &job,
                                              const CanvasSize &canvas) const;

  [[nodiscard]] const LayoutEngine &layout_engine() const noexcept {
    return layoutEngine_;
  }
  [[nodiscard]] const TextRenderer &text_renderer() const noexcept {
    return textRenderer_;
  }

private:
  LayoutEngine layoutEngine_;
  PanelRenderer panelRenderer_;
  TextRenderer textRenderer_;
};

} // namespace WordCard
