#pragma once

#include "starhelm/core/Hash.h"
#include "starhelm/core/Types.h"
#include "starhelm/math/Math.h"
#include "starhelm/math/Vec3.h"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace starhelm::core {

// SplitMix64: fast, simple PRNG with 64-bit state.
// Every stochastic choice in the simulation draws from one of these, seeded from
// ids, so a run is reproducible from its (dt, input) sequence.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed) : m_state(seed) {}

  u64 nextU64() {
    m_state += 0x9E3779B97F4A7C15ull;
    return mix64(m_state);
  }

  // [0, 1)
  double nextDouble01() {
    const u64 mantissa = nextU64() >> 11; // top 53 bits
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
  }

  // Uniform real in [min, max)
  double uniform(double min, double max) {
    return min + (max - min) * nextDouble01();
  }

  // Uniformly distributed direction on the unit sphere.
  math::Vec3d unitVector() {
    const double z = uniform(-1.0, 1.0);
    const double phi = uniform(0.0, math::twoPi);
    const double r = std::sqrt(std::max(0.0, 1.0 - z * z));
    return {r * std::cos(phi), r * std::sin(phi), z};
  }

private:
  u64 m_state = 0;
};

// Derive a child seed from a parent seed and a tag.
inline u64 deriveSeed(u64 parent, std::string_view tag) { return hashCombine(parent, fnv1a64(tag)); }

} // namespace starhelm::core
