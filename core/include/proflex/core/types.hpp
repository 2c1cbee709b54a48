#pragma once

#include <algorithm>
#include <cmath>

namespace proflex::core {

// Logical canvas space. Node positions always stay inside [kCanvasMin, kCanvasMax] on both axes.
constexpr double kCanvasMin = 0.0;
constexpr double kCanvasMax = 1000.0;

struct Vec2d {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Vec2d&) const = default;
};

inline Vec2d operator+(const Vec2d& a, const Vec2d& b) {
  return {a.x + b.x, a.y + b.y};
}

inline Vec2d operator-(const Vec2d& a, const Vec2d& b) {
  return {a.x - b.x, a.y - b.y};
}

inline double length(const Vec2d& v) {
  return std::sqrt(v.x * v.x + v.y * v.y);
}

inline bool is_finite(const Vec2d& v) {
  return std::isfinite(v.x) && std::isfinite(v.y);
}

inline Vec2d clamp_to_canvas(const Vec2d& v) {
  return {std::clamp(v.x, kCanvasMin, kCanvasMax), std::clamp(v.y, kCanvasMin, kCanvasMax)};
}

// Largest per-axis displacement. Drag thresholds are compared against this.
inline double chebyshev_distance(const Vec2d& a, const Vec2d& b) {
  return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

inline double distance_to_segment(const Vec2d& p, const Vec2d& a, const Vec2d& b) {
  const Vec2d ab = b - a;
  const double len_sq = ab.x * ab.x + ab.y * ab.y;
  if (len_sq <= 1e-12) {
    return length(p - a);
  }
  const double t = std::clamp(((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / len_sq, 0.0, 1.0);
  const Vec2d closest{a.x + ab.x * t, a.y + ab.y * t};
  return length(p - closest);
}

}  // namespace proflex::core
