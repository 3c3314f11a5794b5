/**
 * @file theme.cpp
 * @brief Theme table and name parsing
 */

#include "card/theme.hpp"

#include <string>

namespace WordCard {

namespace {

using Color::RGBA;

// name, fill, corners, text, shadow,
// panel, gradient top, gradient bottom, blur sigma, padding, corner radius,
// shadow offset, shadow color, stroke width, stroke color,
// decoration, backdrop blur, backdrop brightness
constexpr std::array<ThemeSpec, 5> kThemeTable = {{
    {ThemeName::Standard, PanelFill::Solid, CornerStyle::Rounded,
     RGBA{255, 255, 255, 255}, true,
     RGBA{0, 0, 0, 128}, RGBA{0, 0, 0, 0}, RGBA{0, 0, 0, 0}, 0.0f, 40.0f, 30.0f,
     2, RGBA{0, 0, 0, 255}, 0.0f, RGBA{0, 0, 0, 0},
     true, 0.0f, 1.0f},

    {ThemeName::Focus, PanelFill::Blurred, CornerStyle::Rounded,
     RGBA{255, 255, 255, 255}, true,
     RGBA{20, 20, 20, 90}, RGBA{0, 0, 0, 0}, RGBA{0, 0, 0, 0}, 8.0f, 40.0f, 30.0f,
     3, RGBA{0, 0, 0, 200}, 0.0f, RGBA{0, 0, 0, 0},
     true, 8.0f, 0.6f},

    {ThemeName::Elegant, PanelFill::Gradient, CornerStyle::Rounded,
     RGBA{255, 255, 255, 255}, true,
     RGBA{40, 40, 40, 120}, RGBA{40, 40, 40, 200}, RGBA{40, 40, 40, 100}, 0.0f,
     64.0f, 30.0f,
     2, RGBA{0, 0, 0, 180}, 0.0f, RGBA{0, 0, 0, 0},
     true, 5.0f, 0.85f},

    {ThemeName::Dark, PanelFill::Solid, CornerStyle::Square,
     RGBA{230, 230, 230, 255}, false,
     RGBA{10, 10, 10, 200}, RGBA{0, 0, 0, 0}, RGBA{0, 0, 0, 0}, 0.0f, 40.0f, 0.0f,
     0, RGBA{0, 0, 0, 0}, 2.0f, RGBA{0, 0, 0, 255},
     true, 3.0f, 0.5f},

    {ThemeName::Minimal, PanelFill::None, CornerStyle::Square,
     RGBA{255, 255, 255, 255}, true,
     RGBA{0, 0, 0, 0}, RGBA{0, 0, 0, 0}, RGBA{0, 0, 0, 0}, 0.0f, 0.0f, 0.0f,
     4, RGBA{0, 0, 0, 230}, 0.0f, RGBA{0, 0, 0, 0},
     false, 10.0f, 0.4f},
}};

} // anonymous namespace

const ThemeSpec &theme_spec(ThemeName name) noexcept {
  return kThemeTable[static_cast<size_t>(name)];
}

CardResult<ThemeName> parse_theme_name(std::string_view name) {
  for (ThemeName t : kAllThemes) {
    if (theme_name(t) == name) {
      return t;
    }
  }
  return make_error(CardErrorCode::InvalidConfiguration,
                    "Unknown theme: '" + std::string(name) +
                        "' (expected standard, focus, elegant, dark or minimal)");
}

std::string_view theme_name(ThemeName name) noexcept {
  switch (name) {
  case ThemeName::Standard:
    return "standard";
  case ThemeName::Focus:
    return "focus";
  case ThemeName::Elegant:
    return "elegant";
  case ThemeName::Dark:
    return "dark";
  case ThemeName::Minimal:
    return "minimal";
  }
  return "standard";
}

CardResult<BackgroundShape> parse_background_shape(std::string_view name) {
  if (name == "rectangle")
    return BackgroundShape::Rectangle;
  if (name == "wave")
    return BackgroundShape::Wave;
  return make_error(CardErrorCode::InvalidConfiguration,
                    "Unknown background style: '" + std::string(name) +
                        "' (expected rectangle or wave)");
}

std::string_view background_shape_name(BackgroundShape shape) noexcept {
  return shape == BackgroundShape::Wave ? "wave" : "rectangle";
}

} // namespace WordCard
