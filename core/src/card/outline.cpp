/**
 * @file outline.cpp
 * @brief Panel outlines and polygon coverage rasterization
 */

#include "card/outline.hpp"

#include <algorithm>
#include <cmath>

namespace WordCard {

using Math::RectF;
using Math::Vec2f;

namespace {

constexpr int kVerticalSamples = 4;

RectF bounds_of(const std::vector<Vec2f> &points) {
  if (points.empty()) {
    return {};
  }
  float min_x = points[0].x, max_x = points[0].x;
  float min_y = points[0].y, max_y = points[0].y;
  for (const Vec2f &p : points) {
    min_x = std::min(min_x, p.x);
    max_x = std::max(max_x, p.x);
    min_y = std::min(min_y, p.y);
    max_y = std::max(max_y, p.y);
  }
  return {min_x, min_y, max_x - min_x, max_y - min_y};
}

Vec2f clamp_to(const RectF &rect, Vec2f p) {
  return {Math::clamp(p.x, rect.left(), rect.right()),
          Math::clamp(p.y, rect.top(), rect.bottom())};
}

void append_arc(std::vector<Vec2f> &points, const RectF &rect, Vec2f center,
                float radius, float start_angle, int segments) {
  for (int i = 0; i <= segments; ++i) {
    float angle = start_angle + (Math::kPi * 0.5f) * i / segments;
    points.push_back(clamp_to(rect, {center.x + radius * std::cos(angle),
                                     center.y + radius * std::sin(angle)}));
  }
}

} // anonymous namespace

// ============================================================================
// Outline generators
// ============================================================================

Outline RectangleOutline::generate(const RectF &rect) const {
  Outline outline;
  float radius =
      std::min({cornerRadius_, rect.width * 0.5f, rect.height * 0.5f});

  if (radius <= 0.0f) {
    outline.points = {{rect.left(), rect.top()},
                      {rect.right(), rect.top()},
                      {rect.right(), rect.bottom()},
                      {rect.left(), rect.bottom()}};
  } else {
    int segments = std::clamp(static_cast<int>(std::ceil(radius * 0.5f)), 4, 32);
    const float half_pi = Math::kPi * 0.5f;
    // Clockwise in screen space (y down), starting at the top-left corner
    append_arc(outline.points, rect,
               {rect.left() + radius, rect.top() + radius}, radius,
               Math::kPi, segments);
    append_arc(outline.points, rect,
               {rect.right() - radius, rect.top() + radius}, radius,
               -half_pi, segments);
    append_arc(outline.points, rect,
               {rect.right() - radius, rect.bottom() - radius}, radius, 0.0f,
               segments);
    append_arc(outline.points, rect,
               {rect.left() + radius, rect.bottom() - radius}, radius, half_pi,
               segments);
  }

  outline.bounds = bounds_of(outline.points);
  return outline;
}

float WaveOutline::top_edge(const RectF &rect, float x) const noexcept {
  // Keep the two edges apart on short panels
  float amplitude = std::min(amplitude_, rect.height * 0.25f);
  float wavelength = rect.width / wavesPerPanel_;
  if (wavelength <= 0.0f) {
    return rect.top();
  }
  float phase = 2.0f * Math::kPi * std::fabs(x - rect.center_x()) / wavelength;
  return rect.top() + amplitude - amplitude * std::cos(phase);
}

Outline WaveOutline::generate(const RectF &rect) const {
  Outline outline;
  int segments = std::max(8, static_cast<int>(std::ceil(rect.width * 0.5f)));
  outline.points.reserve(static_cast<size_t>(segments + 1) * 2);

  for (int i = 0; i <= segments; ++i) {
    float x = rect.left() + rect.width * i / segments;
    outline.points.push_back(clamp_to(rect, {x, top_edge(rect, x)}));
  }
  for (int i = segments; i >= 0; --i) {
    float x = rect.left() + rect.width * i / segments;
    float dip = top_edge(rect, x) - rect.top();
    outline.points.push_back(clamp_to(rect, {x, rect.bottom() - dip}));
  }

  outline.bounds = bounds_of(outline.points);
  return outline;
}

std::unique_ptr<OutlineGenerator>
make_outline_generator(BackgroundShape shape, const ThemeSpec &theme) {
  if (shape == BackgroundShape::Wave) {
    return std::make_unique<WaveOutline>();
  }
  float radius =
      theme.corner_style == CornerStyle::Rounded ? theme.corner_radius : 0.0f;
  return std::make_unique<RectangleOutline>(radius);
}

// ============================================================================
// Coverage rasterization
// ============================================================================

CoverageMask CoverageMask::rasterize(const Outline &outline,
                                     uint32_t canvas_width,
                                     uint32_t canvas_height) {
  CoverageMask mask;
  mask.bounds_ = Math::pixel_bounds(outline.bounds,
                                    static_cast<int32_t>(canvas_width),
                                    static_cast<int32_t>(canvas_height));
  if (mask.bounds_.empty() || outline.points.size() < 3) {
    mask.bounds_ = {};
    return mask;
  }

  const Math::RectI &b = mask.bounds_;
  mask.coverage_.assign(static_cast<size_t>(b.width) * b.height, 0.0f);

  const auto &pts = outline.points;
  const size_t n = pts.size();
  std::vector<float> crossings;
  const float weight = 1.0f / kVerticalSamples;
  const float clip_left = static_cast<float>(b.x);
  const float clip_right = static_cast<float>(b.x + b.width);

  for (int32_t row = 0; row < b.height; ++row) {
    float *cov_row = &mask.coverage_[static_cast<size_t>(row) * b.width];

    for (int s = 0; s < kVerticalSamples; ++s) {
      float sy = static_cast<float>(b.y + row) + (s + 0.5f) * weight;

      crossings.clear();
      for (size_t i = 0; i < n; ++i) {
        const Vec2f &p0 = pts[i];
        const Vec2f &p1 = pts[(i + 1) % n];
        if ((p0.y <= sy) != (p1.y <= sy)) {
          float t = (sy - p0.y) / (p1.y - p0.y);
          crossings.push_back(p0.x + t * (p1.x - p0.x));
        }
      }
      std::sort(crossings.begin(), crossings.end());

      for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
        float xa = std::max(crossings[i], clip_left);
        float xb = std::min(crossings[i + 1], clip_right);
        if (xb <= xa) {
          continue;
        }
        auto px0 = static_cast<int32_t>(std::floor(xa));
        auto px1 = static_cast<int32_t>(std::ceil(xb));
        for (int32_t px = px0; px < px1; ++px) {
          float overlap = std::min(xb, static_cast<float>(px + 1)) -
                          std::max(xa, static_cast<float>(px));
          if (overlap > 0.0f) {
            cov_row[px - b.x] += overlap * weight;
          }
        }
      }
    }
  }

  for (float &c : mask.coverage_) {
    c = std::min(c, 1.0f);
  }
  return mask;
}

float CoverageMask::at(int32_t x, int32_t y) const noexcept {
  if (x < bounds_.x || y < bounds_.y || x >= bounds_.x + bounds_.width ||
      y >= bounds_.y + bounds_.height) {
    return 0.0f;
  }
  return coverage_[static_cast<size_t>(y - bounds_.y) * bounds_.width +
                   (x - bounds_.x)];
}

} // namespace WordCard
