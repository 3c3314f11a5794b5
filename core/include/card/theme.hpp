#pragma once
/**
 * @file theme.hpp
 * @brief Built-in card themes and background shapes
 *
 * The five themes are a closed set: ThemeName indexes a constant table of
 * ThemeSpec records. Background shape is chosen independently of the theme.
 */

#include "core/color.hpp"
#include "core/result.hpp"

#include <array>
#include <string_view>

namespace WordCard {

enum class ThemeName { Standard, Focus, Elegant, Dark, Minimal };

enum class PanelFill { Solid, Blurred, Gradient, None };

enum class CornerStyle { Square, Rounded };

enum class BackgroundShape { Rectangle, Wave };

/// Background style, orthogonal to the theme
struct BackgroundStyle {
  BackgroundShape shape = BackgroundShape::Rectangle;
};

/// Visual constants of one theme
struct ThemeSpec {
  ThemeName name;
  PanelFill panel_fill;
  CornerStyle corner_style;
  Color::RGBA text_color;
  bool shadow;

  Color::RGBA panel_color;     ///< Solid fill, or overlay over a blurred fill
  Color::RGBA gradient_top;    ///< Gradient fill only
  Color::RGBA gradient_bottom; ///< Gradient fill only
  float blur_sigma;            ///< Blurred fill only
  float padding;               ///< Panel padding around the text block (px)
  float corner_radius;         ///< Rounded corners only (px)

  int32_t shadow_offset;
  Color::RGBA shadow_color;
  float stroke_width; ///< > 0: outline pass instead of a drop shadow
  Color::RGBA stroke_color;

  bool decoration; ///< Divider line and dots between the text groups

  float backdrop_blur;       ///< Whole-canvas blur when backdrop effects are on
  float backdrop_brightness; ///< Whole-canvas brightness factor

  [[nodiscard]] constexpr bool draws_panel() const noexcept {
    return panel_fill != PanelFill::None;
  }

  /// A panel-less theme always gets a drop shadow to stay legible
  [[nodiscard]] constexpr bool draws_shadow() const noexcept {
    return stroke_width <= 0.0f && (shadow || !draws_panel());
  }
};

constexpr std::array<ThemeName, 5> kAllThemes = {
    ThemeName::Standard, ThemeName::Focus, ThemeName::Elegant, ThemeName::Dark,
    ThemeName::Minimal};

constexpr std::array<BackgroundShape, 2> kAllShapes = {
    BackgroundShape::Rectangle, BackgroundShape::Wave};

/// Constant record of a built-in theme
[[nodiscard]] const ThemeSpec &theme_spec(ThemeName name) noexcept;

[[nodiscard]] CardResult<ThemeName> parse_theme_name(std::string_view name);
[[nodiscard]] std::string_view theme_name(ThemeName name) noexcept;

[[nodiscard]] CardResult<BackgroundShape>
parse_background_shape(std::string_view name);
[[nodiscard]] std::string_view background_shape_name(BackgroundShape shape) noexcept;

} // namespace WordCard
