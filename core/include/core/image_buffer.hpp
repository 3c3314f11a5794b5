#pragma once
/**
 * @file image_buffer.hpp
 * @brief RGBA image buffer and the pixel operations the compositor needs
 */

#include "core/math.hpp"

#include <cstdint>
#include <vector>

namespace WordCard {

/// RGBA image buffer
struct ImageBuffer {
  std::vector<uint8_t> data;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t channels = 4; // RGBA

  /// Create buffer with dimensions, filled transparent black
  static ImageBuffer create(uint32_t w, uint32_t h);

  /// Get pixel at (x, y), nullptr when out of bounds
  [[nodiscard]] uint8_t *pixel(uint32_t x, uint32_t y);
  [[nodiscard]] const uint8_t *pixel(uint32_t x, uint32_t y) const;

  /// Fill with color
  void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

  [[nodiscard]] bool empty() const noexcept {
    return width == 0 || height == 0;
  }

  /// Copy of a sub-rectangle (clipped to the buffer)
  [[nodiscard]] ImageBuffer crop(const Math::RectI &rect) const;
};

/**
 * @brief Resample to a new size
 *
 * Separable tent filter; the filter support widens with the scale factor
 * when shrinking so large photographs do not alias.
 */
[[nodiscard]] ImageBuffer resample(const ImageBuffer &src, uint32_t new_width,
                                   uint32_t new_height);

/**
 * @brief Separable Gaussian blur of a region, in place
 * @param img Image to modify
 * @param region Pixels to blur; samples outside it are read from the image
 *        (clamped at the image border) so the blur has no seam
 * @param sigma Standard deviation in pixels
 */
void gaussian_blur(ImageBuffer &img, const Math::RectI &region, float sigma);

/// Multiply RGB by @p factor (brightness), alpha untouched
void scale_brightness(ImageBuffer &img, float factor);

} // namespace WordCard
