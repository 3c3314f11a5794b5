#pragma once
/**
 * @file color.hpp
 * @brief Header-only color utilities
 *
 * RGBA color and the blending helpers used by the panel and text
 * renderers.
 */

#include <cstdint>

namespace WordCard::Color {

// ============================================================================
// RGBA Color Structure
// ============================================================================

/**
 * @brief RGBA color with 8-bit components
 *
 * Memory layout is R, G, B, A (matches ImageBuffer pixel layout)
 */
struct RGBA {
  uint8_t r, g, b, a;

  /// Default constructor (white, opaque)
  constexpr RGBA() noexcept : r(255), g(255), b(255), a(255) {}

  /// Component constructor
  constexpr RGBA(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) noexcept
      : r(r_), g(g_), b(b_), a(a_) {}

  [[nodiscard]] constexpr bool operator==(const RGBA &other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
};

// ============================================================================
// Color Blending
// ============================================================================

/**
 * @brief Blend a color onto an opaque RGBA pixel with extra coverage
 *
 * The destination stays opaque: cards are always flattened photographs.
 * @param dst Pointer to 4 bytes (R, G, B, A)
 * @param src Source color; its alpha is multiplied by @p coverage
 * @param coverage Anti-aliasing coverage in [0, 1]
 */
inline void blend_pixel(uint8_t *dst, RGBA src, float coverage) noexcept {
  float alpha = (src.a / 255.0f) * coverage;
  if (alpha <= 0.0f) {
    return;
  }
  if (alpha >= 1.0f) {
    dst[0] = src.r;
    dst[1] = src.g;
    dst[2] = src.b;
    dst[3] = 255;
    return;
  }
  float inv_alpha = 1.0f - alpha;
  dst[0] = static_cast<uint8_t>(src.r * alpha + dst[0] * inv_alpha + 0.5f);
  dst[1] = static_cast<uint8_t>(src.g * alpha + dst[1] * inv_alpha + 0.5f);
  dst[2] = static_cast<uint8_t>(src.b * alpha + dst[2] * inv_alpha + 0.5f);
  dst[3] = 255;
}

/**
 * @brief Lerp between two colors
 */
[[nodiscard]] constexpr RGBA lerp(RGBA a, RGBA b, float t) noexcept {
  auto lerp_u8 = [](uint8_t a, uint8_t b, float t) constexpr -> uint8_t {
    return static_cast<uint8_t>(a + (b - a) * t + 0.5f);
  };
  return {lerp_u8(a.r, b.r, t), lerp_u8(a.g, b.g, t), lerp_u8(a.b, b.b, t),
          lerp_u8(a.a, b.a, t)};
}

/**
 * @brief Set alpha of color
 */
[[nodiscard]] constexpr RGBA with_alpha(RGBA c, uint8_t alpha) noexcept {
  return {c.r, c.g, c.b, alpha};
}

} // namespace WordCard::Color
