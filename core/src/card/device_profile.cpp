/**
 * @file device_profile.cpp
 * @brief Device preset table and background fitting
 */

#include "card/device_profile.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace WordCard {

DeviceProfile resolve_device_profile(DeviceMode mode) noexcept {
  switch (mode) {
  case DeviceMode::Mobile:
    // Higher pixel density: enlarge fonts
    return {mode, CanvasSize{1080, 1920}, 1.15f};
  case DeviceMode::Tablet:
    return {mode, CanvasSize{1536, 2048}, 1.0f};
  case DeviceMode::Desktop:
    return {mode, CanvasSize{1920, 1080}, 1.0f};
  case DeviceMode::Auto:
    break;
  }
  return {DeviceMode::Auto, std::nullopt, 1.0f};
}

CardResult<DeviceMode> parse_device_mode(std::string_view name) {
  if (name == "auto")
    return DeviceMode::Auto;
  if (name == "mobile")
    return DeviceMode::Mobile;
  if (name == "tablet")
    return DeviceMode::Tablet;
  if (name == "desktop")
    return DeviceMode::Desktop;
  return make_error(CardErrorCode::InvalidConfiguration,
                    "Unknown device mode: '" + std::string(name) +
                        "' (expected auto, mobile, tablet or desktop)");
}

CardResult<DeviceProfile> resolve_device_profile(std::string_view name) {
  auto mode = parse_device_mode(name);
  if (!mode) {
    return mode.error();
  }
  return resolve_device_profile(*mode);
}

std::string_view device_mode_name(DeviceMode mode) noexcept {
  switch (mode) {
  case DeviceMode::Auto:
    return "auto";
  case DeviceMode::Mobile:
    return "mobile";
  case DeviceMode::Tablet:
    return "tablet";
  case DeviceMode::Desktop:
    return "desktop";
  }
  return "auto";
}

CanvasSize canvas_size_for(const DeviceProfile &profile,
                           const ImageBuffer &background) noexcept {
  if (profile.canvas_size) {
    return *profile.canvas_size;
  }
  return {background.width, background.height};
}

ImageBuffer fit_to_device(const ImageBuffer &background,
                          const DeviceProfile &profile) {
  if (!profile.canvas_size || background.empty()) {
    return background;
  }

  const uint32_t target_w = profile.canvas_size->width;
  const uint32_t target_h = profile.canvas_size->height;
  const double src_ratio =
      static_cast<double>(background.width) / background.height;
  const double target_ratio = static_cast<double>(target_w) / target_h;

  // Cover window in source pixels; only that window is resampled, so a
  // panorama never expands to its full cover-scaled size
  Math::RectI window{0, 0, static_cast<int32_t>(background.width),
                     static_cast<int32_t>(background.height)};
  if (src_ratio > target_ratio) {
    // Wider source: keep the full height, crop the sides
    const auto w = static_cast<int32_t>(
        std::lround(static_cast<double>(background.height) * target_ratio));
    window.width = Math::clamp(w, 1, window.width);
    window.x = (static_cast<int32_t>(background.width) - window.width) / 2;
  } else {
    // Narrower or equal: keep the full width, crop top and bottom
    const auto h = static_cast<int32_t>(
        std::lround(static_cast<double>(background.width) / target_ratio));
    window.height = Math::clamp(h, 1, window.height);
    window.y = (static_cast<int32_t>(background.height) - window.height) / 2;
  }

  return resample(background.crop(window), target_w, target_h);
}

} // namespace WordCard
