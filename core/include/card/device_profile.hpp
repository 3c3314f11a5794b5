#pragma once
/**
 * @file device_profile.hpp
 * @brief Device modes: canvas size and font scale per target display
 */

#include "core/image_buffer.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace WordCard {

enum class DeviceMode { Auto, Mobile, Tablet, Desktop };

/// Canvas dimensions
struct CanvasSize {
  uint32_t width = 0;
  uint32_t height = 0;

  [[nodiscard]] constexpr bool operator==(const CanvasSize &other) const noexcept {
    return width == other.width && height == other.height;
  }
};

/// Canvas preset for a display form factor
struct DeviceProfile {
  DeviceMode mode = DeviceMode::Auto;
  std::optional<CanvasSize> canvas_size; ///< none: use the background's size
  float font_scale = 1.0f;
};

/// Documented preset for a mode
[[nodiscard]] DeviceProfile resolve_device_profile(DeviceMode mode) noexcept;

/// Parse "auto" / "mobile" / "tablet" / "desktop"
[[nodiscard]] CardResult<DeviceMode> parse_device_mode(std::string_view name);

/// Parse and resolve in one step; unknown names are InvalidConfiguration
[[nodiscard]] CardResult<DeviceProfile>
resolve_device_profile(std::string_view name);

[[nodiscard]] std::string_view device_mode_name(DeviceMode mode) noexcept;

/// Final canvas size for a background under a profile
[[nodiscard]] CanvasSize canvas_size_for(const DeviceProfile &profile,
                                         const ImageBuffer &background) noexcept;

/**
 * @brief Cover-scale and center-crop a background to the profile's canvas
 *
 * Under Auto the image is returned unchanged.
 */
[[nodiscard]] ImageBuffer fit_to_device(const ImageBuffer &background,
                                        const DeviceProfile &profile);

} // namespace WordCard
