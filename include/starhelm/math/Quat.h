#pragma once

#include "starhelm/math/Math.h"
#include "starhelm/math/Vec3.h"

#include <cmath>
#include <ostream>

namespace starhelm::math {

// Unit quaternion (w, x, y, z). Ship convention: forward is local -Z, up is +Y.
struct Quatd {
  double w = 1.0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Quatd() = default;
  constexpr Quatd(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

  static constexpr Quatd identity() { return {1.0, 0.0, 0.0, 0.0}; }

  static Quatd fromAxisAngle(const Vec3d& axis, double angleRad) {
    const Vec3d n = axis.normalized();
    if (n.lengthSquared() <= 0.0) return identity();
    const double half = angleRad * 0.5;
    const double s = std::sin(half);
    return {std::cos(half), n.x * s, n.y * s, n.z * s};
  }

  // Level (zero-roll) orientation whose forward (-Z) points along `dir`.
  // Returns identity for a zero-length direction.
  static Quatd lookAlong(const Vec3d& dir) {
    const Vec3d d = dir.normalized();
    if (d.lengthSquared() <= 0.0) return identity();
    const double yaw = std::atan2(-d.x, -d.z);
    const double pitch = std::asin(clamp(d.y, -1.0, 1.0));
    return (fromAxisAngle({0, 1, 0}, yaw) * fromAxisAngle({1, 0, 0}, pitch)).normalized();
  }

  Quatd operator*(const Quatd& q) const {
    return {
      w*q.w - x*q.x - y*q.y - z*q.z,
      w*q.x + x*q.w + y*q.z - z*q.y,
      w*q.y - x*q.z + y*q.w + z*q.x,
      w*q.z + x*q.y - y*q.x + z*q.w
    };
  }

  Quatd conjugate() const { return {w, -x, -y, -z}; }

  double lengthSquared() const { return w*w + x*x + y*y + z*z; }

  Quatd normalized() const {
    const double len = std::sqrt(lengthSquared());
    if (len <= 0.0) return identity();
    return {w / len, x / len, y / len, z / len};
  }

  Vec3d rotate(const Vec3d& v) const {
    const Vec3d u{x, y, z};
    return u * (2.0 * math::dot(u, v))
         + v * (w*w - math::dot(u, u))
         + math::cross(u, v) * (2.0 * w);
  }

  Vec3d forward() const { return rotate({0.0, 0.0, -1.0}); }
};

inline double dot(const Quatd& a, const Quatd& b) {
  return a.w*b.w + a.x*b.x + a.y*b.y + a.z*b.z;
}

// Shortest-arc spherical interpolation, t in [0,1].
inline Quatd slerp(const Quatd& a, const Quatd& b, double t) {
  t = clamp(t, 0.0, 1.0);
  double c = dot(a, b);

  Quatd end = b;
  if (c < 0.0) {
    end = {-b.w, -b.x, -b.y, -b.z};
    c = -c;
  }

  if (c > 0.9995) {
    // Nearly parallel: nlerp is accurate and avoids dividing by sin(~0).
    return Quatd{
      a.w + (end.w - a.w) * t,
      a.x + (end.x - a.x) * t,
      a.y + (end.y - a.y) * t,
      a.z + (end.z - a.z) * t
    }.normalized();
  }

  const double theta = std::acos(clamp(c, -1.0, 1.0));
  const double s = std::sin(theta);
  const double ra = std::sin((1.0 - t) * theta) / s;
  const double rb = std::sin(t * theta) / s;

  return Quatd{
    a.w * ra + end.w * rb,
    a.x * ra + end.x * rb,
    a.y * ra + end.y * rb,
    a.z * ra + end.z * rb
  }.normalized();
}

inline std::ostream& operator<<(std::ostream& os, const Quatd& q) {
  os << "(" << q.w << "; " << q.x << ", " << q.y << ", " << q.z << ")";
  return os;
}

} // namespace starhelm::math
