#include "starhelm/sim/Flight.h"

#include <algorithm>
#include <cmath>

namespace starhelm::sim {

FlightController::FlightController(const FlightParams& params) : params_(params) {
  state_.orientation = math::Quatd::identity();
  heading_ = state_.orientation;
}

double FlightController::impulseSpeed() const {
  return (state_.throttlePercent / 100.0) * params_.maxImpulseSpeed;
}

void FlightController::fullStop() {
  state_.throttlePercent = 0.0;
  state_.targetThrottlePercent = 0.0;
}

void FlightController::integrateThrottle(double dt, const InputFrame& input) {
  const double axis = input.held.throttleAxis;
  double target = state_.targetThrottlePercent;

  if (axis > 0.0) {
    target = math::moveTowards(target, 100.0, params_.accelerationPctPerSec * axis * dt);
  } else if (axis < 0.0) {
    target = math::moveTowards(target, 0.0, params_.decelerationPctPerSec * -axis * dt);
  } else if (dt > 0.0) {
    // Frame-rate independent form of "target *= damping" per reference frame.
    const double damping = math::clamp(params_.throttleDampingPerFrame, 0.0, 1.0);
    target *= std::pow(damping, dt * params_.dampingReferenceHz);
    if (target < params_.throttleSnapPct) target = 0.0;
  }

  state_.targetThrottlePercent = math::clamp(target, 0.0, 100.0);

  if (input.pressed.fullStop) {
    fullStop();
    return;
  }

  const double cur = state_.throttlePercent;
  const double rate = (state_.targetThrottlePercent > cur) ? params_.accelerationPctPerSec
                                                          : params_.decelerationPctPerSec;
  state_.throttlePercent = math::clamp(math::moveTowards(cur, state_.targetThrottlePercent, rate * dt), 0.0, 100.0);
}

void FlightController::integrateAttitude(double dt, const InputSnapshot& held) {
  if (dt <= 0.0) return;

  if (held.yawAxis != 0.0 || held.pitchAxis != 0.0) {
    const math::Quatd yaw = math::Quatd::fromAxisAngle({0, 1, 0}, held.yawAxis * params_.yawRateRadS * dt);
    const math::Quatd pitch = math::Quatd::fromAxisAngle({1, 0, 0}, held.pitchAxis * params_.pitchRateRadS * dt);
    heading_ = (heading_ * yaw * pitch).normalized();
  }

  if (held.rollAxis != 0.0) {
    roll_ += held.rollAxis * params_.rollRateRadS * dt;
  } else {
    // Bank into the turn, level out when flying straight.
    const double bankTarget = held.yawAxis * params_.bankAngleRad;
    roll_ = math::moveTowards(roll_, bankTarget, params_.rollLevelRateRadS * dt);
  }
  roll_ = math::clamp(roll_, -params_.maxRollRad, params_.maxRollRad);

  state_.orientation = (heading_ * math::Quatd::fromAxisAngle({0, 0, 1}, roll_)).normalized();
}

const ShipKinematics& FlightController::update(double dtSeconds, const InputFrame& input) {
  const double dt = std::max(0.0, dtSeconds);
  const InputSnapshot held = input.held.sanitized();

  InputFrame frame = input;
  frame.held = held;

  warpEngageRequested_ = input.pressed.engageWarp;

  integrateThrottle(dt, frame);

  if (warpOverride_) {
    // Warp owns position and attitude; keep impulse state for the return to normal space.
    state_.velocity = {};
    return state_;
  }

  integrateAttitude(dt, held);

  state_.velocity = state_.orientation.forward() * impulseSpeed();
  state_.position += state_.velocity * dt;
  return state_;
}

void FlightController::overridePosition(const math::Vec3d& position, double dtSeconds) {
  state_.velocity = (dtSeconds > 0.0) ? (position - state_.position) / dtSeconds : math::Vec3d{};
  state_.position = position;
}

void FlightController::overrideOrientation(const math::Quatd& orientation) {
  heading_ = orientation.normalized();
  roll_ = 0.0;
  state_.orientation = heading_;
}

void FlightController::reset(const math::Vec3d& position, const math::Quatd& orientation) {
  state_ = ShipKinematics{};
  state_.position = position;
  heading_ = orientation.normalized();
  roll_ = 0.0;
  state_.orientation = heading_;
  warpOverride_ = false;
  warpEngageRequested_ = false;
}

} // namespace starhelm::sim
