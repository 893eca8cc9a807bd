#pragma once

#include <algorithm>
#include <cmath>

namespace starhelm::math {

constexpr double pi = 3.141592653589793238462643383279502884;
constexpr double twoPi = 2.0 * pi;

template <typename T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : (v > hi) ? hi : v;
}

inline double smoothstep(double t) {
  t = std::clamp(t, 0.0, 1.0);
  return t * t * (3.0 - 2.0 * t);
}

// Step `current` toward `target` by at most `maxStep` (>= 0) without overshooting.
inline double moveTowards(double current, double target, double maxStep) {
  if (maxStep <= 0.0) return current;
  const double d = target - current;
  if (std::abs(d) <= maxStep) return target;
  return current + (d > 0.0 ? maxStep : -maxStep);
}

// Like clamp(), but NaN maps to lo.
inline double clampFinite(double v, double lo, double hi) {
  if (std::isnan(v)) return lo;
  return std::clamp(v, lo, hi);
}

} // namespace starhelm::math
