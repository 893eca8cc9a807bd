#pragma once

#include "starhelm/math/Math.h"
#include "starhelm/math/Quat.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Input.h"

namespace starhelm::sim {

// Impulse-drive handling. Rates are per second; throttle is in percent.
struct FlightParams {
  double maxImpulseSpeed{15.0};        // units/s at 100% throttle

  double accelerationPctPerSec{40.0};  // spool-up rate (target and actual)
  double decelerationPctPerSec{25.0};  // spool-down rate (target and actual)

  // With no throttle input the target decays by this factor every
  // 1/dampingReferenceHz seconds, then snaps to 0 below throttleSnapPct.
  double throttleDampingPerFrame{0.98};
  double dampingReferenceHz{60.0};
  double throttleSnapPct{0.5};

  double yawRateRadS{0.8};
  double pitchRateRadS{0.8};
  double rollRateRadS{1.0};

  double maxRollRad{math::pi / 4.0};
  double bankAngleRad{math::pi / 12.0};  // roll the ship settles at while yawing
  double rollLevelRateRadS{0.6};         // auto-level / bank convergence speed
};

// Owned by FlightController. Everything else reads it.
struct ShipKinematics {
  math::Vec3d position{};
  math::Quatd orientation{};
  math::Vec3d velocity{};
  double throttlePercent{0.0};
  double targetThrottlePercent{0.0};

  double speed() const { return velocity.length(); }
  math::Vec3d forward() const { return orientation.forward(); }
};

class FlightController {
public:
  explicit FlightController(const FlightParams& params = {});

  // Integrates one tick. dt is expected to be clamped by the caller.
  const ShipKinematics& update(double dtSeconds, const InputFrame& input);

  const ShipKinematics& state() const { return state_; }
  const FlightParams& params() const { return params_; }

  // True only during the tick in which engage-warp was pressed.
  bool warpEngageRequested() const { return warpEngageRequested_; }

  // Zero throttle and target throttle immediately.
  void fullStop();

  // While set, position integration and manual attitude input are suspended;
  // the warp drive moves the ship through the override calls below.
  void setWarpOverride(bool active) { warpOverride_ = active; }
  bool warpOverride() const { return warpOverride_; }

  void overridePosition(const math::Vec3d& position, double dtSeconds);
  // Adopts `orientation` as the new heading with zero roll.
  void overrideOrientation(const math::Quatd& orientation);

  void reset(const math::Vec3d& position, const math::Quatd& orientation);

  double rollRad() const { return roll_; }
  double impulseSpeed() const;

private:
  void integrateThrottle(double dt, const InputFrame& input);
  void integrateAttitude(double dt, const InputSnapshot& held);

  FlightParams params_;
  ShipKinematics state_{};
  math::Quatd heading_{};
  double roll_{0.0};
  bool warpOverride_{false};
  bool warpEngageRequested_{false};
};

} // namespace starhelm::sim
