#pragma once

#include "starhelm/math/Math.h"

#include <algorithm>
#include <cmath>

namespace starhelm::sim {

// Per-tick intent sampled by the host (keyboard, gamepad, script).
// Axes are in [-1, 1]; anything outside is clamped by sanitized().
struct InputSnapshot {
  double throttleAxis{0.0}; // +1 forward (spool up), -1 backward (spool down)
  double yawAxis{0.0};      // +1 turn left
  double pitchAxis{0.0};    // +1 nose up
  double rollAxis{0.0};     // +1 roll left

  bool fullStop{false};
  bool engageWarp{false};
  bool emergencyStop{false};
  bool skipToDestination{false};

  bool firePhasers{false};  // held
  bool fireTorpedo{false};
  bool cycleTarget{false};
  bool scan{false};

  InputSnapshot sanitized() const {
    InputSnapshot s = *this;
    s.throttleAxis = axis(throttleAxis);
    s.yawAxis = axis(yawAxis);
    s.pitchAxis = axis(pitchAxis);
    s.rollAxis = axis(rollAxis);
    return s;
  }

  // NaN reads as a centred stick.
  static double axis(double v) { return std::isnan(v) ? 0.0 : math::clamp(v, -1.0, 1.0); }
};

// Rising/falling edges of the boolean intents relative to the previous tick.
struct InputEdges {
  bool fullStop{false};
  bool engageWarp{false};
  bool emergencyStop{false};
  bool skipToDestination{false};
  bool firePhasersPressed{false};
  bool firePhasersReleased{false};
  bool fireTorpedo{false};
  bool cycleTarget{false};
  bool scan{false};
};

inline InputEdges detectEdges(const InputSnapshot& now, const InputSnapshot& prev) {
  InputEdges e;
  e.fullStop = now.fullStop && !prev.fullStop;
  e.engageWarp = now.engageWarp && !prev.engageWarp;
  e.emergencyStop = now.emergencyStop && !prev.emergencyStop;
  e.skipToDestination = now.skipToDestination && !prev.skipToDestination;
  e.firePhasersPressed = now.firePhasers && !prev.firePhasers;
  e.firePhasersReleased = !now.firePhasers && prev.firePhasers;
  e.fireTorpedo = now.fireTorpedo && !prev.fireTorpedo;
  e.cycleTarget = now.cycleTarget && !prev.cycleTarget;
  e.scan = now.scan && !prev.scan;
  return e;
}

// What a subsystem sees for one tick: held state plus edges.
struct InputFrame {
  InputSnapshot held{};
  InputEdges pressed{};
};

// Frame stalls (backgrounded host, debugger) must not blow up the integrators.
constexpr double kDefaultMaxDeltaSec = 0.1;

inline double clampDelta(double dtSeconds, double maxDeltaSec = kDefaultMaxDeltaSec) {
  if (!std::isfinite(dtSeconds) || dtSeconds <= 0.0) return 0.0;
  return std::min(dtSeconds, std::max(0.0, maxDeltaSec));
}

} // namespace starhelm::sim
