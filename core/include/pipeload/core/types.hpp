#pragma once

#include <cmath>

namespace pipeload::core {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSqrt3Over2 = 0.86602540378443864676;

// Cross-section plane of a container: x runs across the width, y runs up from the bed.
struct Vec2d {
  double x = 0.0;
  double y = 0.0;
};

inline Vec2d operator-(const Vec2d& a, const Vec2d& b) {
  return {a.x - b.x, a.y - b.y};
}

struct Extent2d {
  double width = 0.0;
  double height = 0.0;
};

inline double circle_area(double diameter) {
  const double r = diameter * 0.5;
  return kPi * r * r;
}

inline double distance(const Vec2d& a, const Vec2d& b) {
  const Vec2d d = a - b;
  return std::sqrt(d.x * d.x + d.y * d.y);
}

}  // namespace pipeload::core
