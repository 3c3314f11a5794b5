#pragma once
/**
 * @file outline.hpp
 * @brief Panel boundary paths and their anti-aliased coverage
 *
 * The panel renderer never knows which shape it fills: an OutlineGenerator
 * turns the panel rectangle into a closed polygon and CoverageMask turns
 * the polygon into per-pixel coverage.
 */

#include "card/theme.hpp"
#include "core/math.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace WordCard {

/// Wave crest-to-trough half height (px)
constexpr float kWaveAmplitude = 14.0f;

/// Wavelength is the panel width divided by this
constexpr float kWavesPerPanel = 3.0f;

/// Closed polygon, last point connects back to the first
struct Outline {
  std::vector<Math::Vec2f> points;
  Math::RectF bounds;
};

/**
 * @brief Produces the boundary of a panel inside its rectangle
 *
 * Every generated point lies inside @p rect.
 */
class OutlineGenerator {
public:
  virtual ~OutlineGenerator() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual Outline generate(const Math::RectF &rect) const = 0;
};

/// Rectangle; rounded when corner_radius > 0 (a circle at half the side)
class RectangleOutline final : public OutlineGenerator {
public:
  explicit RectangleOutline(float corner_radius = 0.0f)
      : cornerRadius_(corner_radius) {}

  [[nodiscard]] std::string_view name() const noexcept override {
    return cornerRadius_ > 0.0f ? "rounded-rectangle" : "rectangle";
  }
  [[nodiscard]] Outline generate(const Math::RectF &rect) const override;

private:
  float cornerRadius_;
};

/**
 * @brief Sinusoidal top and bottom edges, straight sides
 *
 * The top edge is y = top + A - A * cos(2 * pi * (x - cx) / wavelength),
 * so the crest touches the rectangle's top on the vertical center line and
 * the outline is mirror-symmetric about it. The bottom edge mirrors the
 * top edge vertically.
 */
class WaveOutline final : public OutlineGenerator {
public:
  explicit WaveOutline(float amplitude = kWaveAmplitude,
                       float waves_per_panel = kWavesPerPanel)
      : amplitude_(amplitude), wavesPerPanel_(waves_per_panel) {}

  [[nodiscard]] std::string_view name() const noexcept override {
    return "wave";
  }
  [[nodiscard]] Outline generate(const Math::RectF &rect) const override;

  /// Top edge height at @p x for a panel @p rect
  [[nodiscard]] float top_edge(const Math::RectF &rect, float x) const noexcept;

private:
  float amplitude_;
  float wavesPerPanel_;
};

/// Outline for a background shape under a theme's corner style
[[nodiscard]] std::unique_ptr<OutlineGenerator>
make_outline_generator(BackgroundShape shape, const ThemeSpec &theme);

/**
 * @brief Anti-aliased coverage of a polygon, clipped to a canvas
 *
 * Each pixel row is sampled by 4 scanlines; along a scanline the covered
 * fraction of every pixel is computed exactly. Even-odd fill rule.
 */
class CoverageMask {
public:
  [[nodiscard]] static CoverageMask rasterize(const Outline &outline,
                                              uint32_t canvas_width,
                                              uint32_t canvas_height);

  /// Pixel rectangle the mask covers (may be empty)
  [[nodiscard]] const Math::RectI &bounds() const noexcept { return bounds_; }

  /// Coverage in [0, 1] at canvas pixel (x, y); 0 outside the bounds
  [[nodiscard]] float at(int32_t x, int32_t y) const noexcept;

private:
  Math::RectI bounds_;
  std::vector<float> coverage_;
};

} // namespace WordCard
