#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Quat.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Destructible.h"
#include "starhelm/sim/Flight.h"

#include <optional>
#include <string>

namespace starhelm::sim {

// Travel cycle: Idle -> Charging -> Accelerating -> Cruising -> Decelerating -> Arriving -> Idle.
// Emergency stop is the only way back to Idle out of order.
enum class WarpPhase : core::u8 {
  Idle = 0,
  Charging,
  Accelerating,
  Cruising,
  Decelerating,
  Arriving,
};

const char* warpPhaseName(WarpPhase p);

// Successor along the travel cycle (Arriving wraps to Idle).
WarpPhase nextWarpPhase(WarpPhase p);

struct WarpParams {
  double chargeTimeSec{2.5};
  double accelerateTimeSec{1.0};
  double decelerateTimeSec{1.2};
  double arrivalTimeSec{0.3};

  // Cruising speed is warpLevel^3 * baseSpeed (units/s).
  double baseSpeed{38.5};

  // Clearance kept from the destination surface.
  double arrivalBuffer{25.0};

  // Alignment slerp fraction per second during Charging.
  double alignRatePerSec{2.0};
  double alignDotThreshold{0.999};

  // Cruising hands over to Decelerating once the remaining travel time drops to this.
  double decelerateLeadSec{0.25};

  int minWarpLevel{1};
  int maxWarpLevel{9};
};

// Navigation selection: what the helm will warp to on the next engage.
struct WarpDestination {
  EntityId id{kNoEntity};
  std::string name;
  math::Vec3d position{};   // body centre
  double radius{0.0};
};

// Captured at engage, reset on return to Idle.
struct WarpTravel {
  WarpPhase phase{WarpPhase::Idle};
  double phaseElapsedSec{0.0};

  EntityId destinationId{kNoEntity};
  std::string destinationName;
  math::Vec3d destinationCenter{};
  std::optional<math::Vec3d> arrivalPoint;
  double arrivalOffset{0.0};        // body radius + arrival buffer

  math::Vec3d departure{};
  math::Quatd alignment{};
  bool aligned{false};

  double totalDistance{0.0};
  double distanceRemaining{0.0};
  math::Vec3d decelerateFrom{};     // position when Decelerating began
  math::Vec3d currentPosition{};    // last interpolated position

  double stretch{0.0};              // [0,1] warp-effect intensity
};

// What the host must apply to the ship this tick.
struct WarpOutput {
  std::optional<math::Vec3d> position;
  std::optional<math::Quatd> orientation;

  bool phaseChanged{false};
  WarpPhase fromPhase{WarpPhase::Idle};
  WarpPhase toPhase{WarpPhase::Idle};

  bool arrived{false};
};

class WarpDrive {
public:
  explicit WarpDrive(const WarpParams& params = {});

  void setDestination(const WarpDestination& destination);
  void clearDestination();
  const std::optional<WarpDestination>& destination() const { return selected_; }

  // Clamped to [minWarpLevel, maxWarpLevel]. Takes effect immediately while cruising.
  void setWarpLevel(int level);
  int warpLevel() const { return warpLevel_; }

  // Starts Charging from Idle. Rejected with no destination, while already
  // travelling, or when the ship is already inside the arrival distance.
  bool engage(const ShipKinematics& ship, std::string* outError = nullptr);

  // Cruising only: collapses the remaining distance so the next update
  // reaches the arrival point.
  bool skipToDestination();

  // Any non-idle phase: back to Idle where the ship currently is.
  bool emergencyStop();

  // Advances the active phase. At most one phase transition per call.
  WarpOutput update(double dtSeconds, const ShipKinematics& ship);

  WarpPhase phase() const { return travel_.phase; }
  bool idle() const { return travel_.phase == WarpPhase::Idle; }
  const WarpTravel& travel() const { return travel_; }
  const WarpParams& params() const { return params_; }

  // Telemetry.
  double cruiseSpeed() const;          // warpLevel^3 * baseSpeed
  double progress() const;             // [0,1]
  double distanceRemaining() const;
  double etaSec() const;               // +inf when speed is 0
  double stretch() const { return travel_.stretch; }

private:
  void enterPhase(WarpPhase next, WarpOutput& out);
  void resetTravel();

  WarpParams params_;
  WarpTravel travel_{};
  std::optional<WarpDestination> selected_;
  int warpLevel_{1};
  bool engagedThisTick_{false};
};

// "MM:SS", or "--:--" when not finite.
std::string formatEta(double seconds);

} // namespace starhelm::sim
