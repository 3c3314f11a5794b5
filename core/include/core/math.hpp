#pragma once
/**
 * @file math.hpp
 * @brief Header-only math utilities
 *
 * Scalars, 2D vectors and rectangles shared by layout and rasterization.
 */

#include <cmath>
#include <cstdint>

namespace WordCard::Math {

constexpr float kPi = 3.14159265358979f;

// ============================================================================
// Basic Math Utilities
// ============================================================================

/// Constexpr lerp (linear interpolation)
template <typename T> [[nodiscard]] constexpr T lerp(T a, T b, T t) noexcept {
  return a + t * (b - a);
}

/// Constexpr clamp
template <typename T>
[[nodiscard]] constexpr T clamp(T val, T min_val, T max_val) noexcept {
  return val < min_val ? min_val : (val > max_val ? max_val : val);
}

/// Constexpr saturate (clamp to [0, 1])
template <typename T> [[nodiscard]] constexpr T saturate(T val) noexcept {
  return clamp(val, T{0}, T{1});
}

// ============================================================================
// 2D Vector
// ============================================================================

template <typename T> struct Vec2 {
  T x, y;

  constexpr Vec2() noexcept : x{}, y{} {}
  constexpr Vec2(T x_, T y_) noexcept : x(x_), y(y_) {}

  [[nodiscard]] constexpr Vec2 operator+(Vec2 other) const noexcept {
    return {x + other.x, y + other.y};
  }

  [[nodiscard]] constexpr Vec2 operator-(Vec2 other) const noexcept {
    return {x - other.x, y - other.y};
  }

  [[nodiscard]] constexpr Vec2 operator*(T scalar) const noexcept {
    return {x * scalar, y * scalar};
  }
};

using Vec2f = Vec2<float>;
using Vec2i = Vec2<int32_t>;

// ============================================================================
// Rectangle
// ============================================================================

/// Axis-aligned rectangle in canvas pixels (top-left origin)
struct RectF {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;

  [[nodiscard]] constexpr float left() const noexcept { return x; }
  [[nodiscard]] constexpr float top() const noexcept { return y; }
  [[nodiscard]] constexpr float right() const noexcept { return x + width; }
  [[nodiscard]] constexpr float bottom() const noexcept { return y + height; }
  [[nodiscard]] constexpr float center_x() const noexcept {
    return x + width * 0.5f;
  }
  [[nodiscard]] constexpr float center_y() const noexcept {
    return y + height * 0.5f;
  }

  /// Grow on every side (negative values shrink)
  [[nodiscard]] constexpr RectF expanded(float dx, float dy) const noexcept {
    return {x - dx, y - dy, width + 2.0f * dx, height + 2.0f * dy};
  }

  /// True if @p other lies entirely inside this rectangle
  [[nodiscard]] constexpr bool contains(const RectF &other) const noexcept {
    return other.left() >= left() && other.top() >= top() &&
           other.right() <= right() && other.bottom() <= bottom();
  }

  /// Intersection with another rectangle (zero-sized if disjoint)
  [[nodiscard]] RectF intersected(const RectF &other) const noexcept {
    float l = std::fmax(left(), other.left());
    float t = std::fmax(top(), other.top());
    float r = std::fmin(right(), other.right());
    float b = std::fmin(bottom(), other.bottom());
    if (r <= l || b <= t) {
      return {l, t, 0.0f, 0.0f};
    }
    return {l, t, r - l, b - t};
  }
};

/// Integer pixel rectangle, half-open [x, x + width)
struct RectI {
  int32_t x = 0;
  int32_t y = 0;
  int32_t width = 0;
  int32_t height = 0;

  [[nodiscard]] constexpr bool empty() const noexcept {
    return width <= 0 || height <= 0;
  }
};

/// Smallest pixel rectangle covering @p r, clipped to [0, w) x [0, h)
[[nodiscard]] inline RectI pixel_bounds(const RectF &r, int32_t w,
                                        int32_t h) noexcept {
  auto x0 = static_cast<int32_t>(std::floor(r.left()));
  auto y0 = static_cast<int32_t>(std::floor(r.top()));
  auto x1 = static_cast<int32_t>(std::ceil(r.right()));
  auto y1 = static_cast<int32_t>(std::ceil(r.bottom()));
  x0 = clamp(x0, 0, w);
  y0 = clamp(y0, 0, h);
  x1 = clamp(x1, 0, w);
  y1 = clamp(y1, 0, h);
  return {x0, y0, x1 - x0, y1 - y0};
}

} // namespace WordCard::Math
