#include "starhelm/sim/WarpDrive.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace starhelm::sim {

const char* warpPhaseName(WarpPhase p) {
  switch (p) {
    case WarpPhase::Idle:         return "idle";
    case WarpPhase::Charging:     return "charging";
    case WarpPhase::Accelerating: return "accelerating";
    case WarpPhase::Cruising:     return "cruising";
    case WarpPhase::Decelerating: return "decelerating";
    case WarpPhase::Arriving:     return "arriving";
  }
  return "unknown";
}

WarpPhase nextWarpPhase(WarpPhase p) {
  switch (p) {
    case WarpPhase::Idle:         return WarpPhase::Charging;
    case WarpPhase::Charging:     return WarpPhase::Accelerating;
    case WarpPhase::Accelerating: return WarpPhase::Cruising;
    case WarpPhase::Cruising:     return WarpPhase::Decelerating;
    case WarpPhase::Decelerating: return WarpPhase::Arriving;
    case WarpPhase::Arriving:     return WarpPhase::Idle;
  }
  return WarpPhase::Idle;
}

WarpDrive::WarpDrive(const WarpParams& params) : params_(params) {
  warpLevel_ = std::max(1, params_.minWarpLevel);
}

void WarpDrive::setDestination(const WarpDestination& destination) {
  selected_ = destination;
}

void WarpDrive::clearDestination() {
  selected_.reset();
}

void WarpDrive::setWarpLevel(int level) {
  warpLevel_ = std::clamp(level, params_.minWarpLevel, params_.maxWarpLevel);
}

double WarpDrive::cruiseSpeed() const {
  const double w = static_cast<double>(warpLevel_);
  return w * w * w * params_.baseSpeed;
}

double WarpDrive::progress() const {
  switch (travel_.phase) {
    case WarpPhase::Cruising:
      if (travel_.totalDistance <= 0.0) return 1.0;
      return math::clamp(1.0 - travel_.distanceRemaining / travel_.totalDistance, 0.0, 1.0);
    case WarpPhase::Decelerating:
    case WarpPhase::Arriving:
      return 1.0;
    default:
      return 0.0;
  }
}

double WarpDrive::distanceRemaining() const {
  return (travel_.phase == WarpPhase::Idle) ? 0.0 : travel_.distanceRemaining;
}

double WarpDrive::etaSec() const {
  if (travel_.phase == WarpPhase::Idle) return 0.0;
  if (travel_.distanceRemaining <= 0.0) return 0.0;
  const double speed = cruiseSpeed();
  if (speed <= 0.0) return std::numeric_limits<double>::infinity();
  return travel_.distanceRemaining / speed;
}

bool WarpDrive::engage(const ShipKinematics& ship, std::string* outError) {
  if (travel_.phase != WarpPhase::Idle) {
    if (outError) *outError = "Warp already engaged.";
    return false;
  }
  if (!selected_) {
    if (outError) *outError = "No destination selected.";
    return false;
  }

  const WarpDestination& dest = *selected_;
  const math::Vec3d toCenter = dest.position - ship.position;
  const double centerDist = toCenter.length();
  const double offset = std::max(0.0, dest.radius) + std::max(0.0, params_.arrivalBuffer);

  if (centerDist <= offset + 1e-6) {
    if (outError) *outError = "Already within arrival distance of " + dest.name + ".";
    return false;
  }

  const math::Vec3d dir = toCenter / centerDist;

  resetTravel();
  travel_.destinationId = dest.id;
  travel_.destinationName = dest.name;
  travel_.destinationCenter = dest.position;
  travel_.arrivalOffset = offset;
  travel_.arrivalPoint = dest.position - dir * offset;
  travel_.departure = ship.position;
  travel_.currentPosition = ship.position;
  travel_.alignment = math::Quatd::lookAlong(dir);
  travel_.totalDistance = centerDist - offset;
  travel_.distanceRemaining = travel_.totalDistance;
  travel_.phase = WarpPhase::Charging;

  engagedThisTick_ = true;

  STARHELM_LOG_INFO("Warp " + std::to_string(warpLevel_) + " engaged for " + dest.name
                    + " (" + std::to_string(static_cast<long long>(travel_.totalDistance)) + " u)");
  return true;
}

bool WarpDrive::skipToDestination() {
  if (travel_.phase != WarpPhase::Cruising) return false;
  travel_.distanceRemaining = 0.0;
  return true;
}

bool WarpDrive::emergencyStop() {
  if (travel_.phase == WarpPhase::Idle) return false;
  STARHELM_LOG_INFO(std::string("Warp emergency stop during ") + warpPhaseName(travel_.phase));
  resetTravel();
  return true;
}

void WarpDrive::resetTravel() {
  travel_ = WarpTravel{};
  engagedThisTick_ = false;
}

void WarpDrive::enterPhase(WarpPhase next, WarpOutput& out) {
  out.phaseChanged = true;
  out.fromPhase = travel_.phase;
  out.toPhase = next;

  travel_.phase = next;
  travel_.phaseElapsedSec = 0.0;

  STARHELM_LOG_INFO(std::string("Warp: ") + warpPhaseName(out.fromPhase) + " -> " + warpPhaseName(next));
}

WarpOutput WarpDrive::update(double dtSeconds, const ShipKinematics& ship) {
  WarpOutput out;
  const double dt = std::max(0.0, dtSeconds);

  // The Idle -> Charging transition happened in engage(); it is this tick's one transition.
  const bool engagedNow = engagedThisTick_;
  if (engagedNow) {
    engagedThisTick_ = false;
    out.phaseChanged = true;
    out.fromPhase = WarpPhase::Idle;
    out.toPhase = WarpPhase::Charging;
  }

  if (travel_.phase == WarpPhase::Idle || !travel_.arrivalPoint) return out;

  const math::Vec3d arrival = *travel_.arrivalPoint;
  travel_.phaseElapsedSec += dt;

  switch (travel_.phase) {
    case WarpPhase::Charging: {
      const double t = math::clamp(params_.alignRatePerSec * dt, 0.0, 1.0);
      math::Quatd q = math::slerp(ship.orientation, travel_.alignment, t);
      travel_.aligned = std::abs(math::dot(q, travel_.alignment)) > params_.alignDotThreshold;
      if (travel_.aligned) q = travel_.alignment;

      out.orientation = q;
      out.position = travel_.departure;
      travel_.currentPosition = travel_.departure;

      if (!engagedNow && travel_.aligned && travel_.phaseElapsedSec >= params_.chargeTimeSec) {
        enterPhase(WarpPhase::Accelerating, out);
      }
      break;
    }

    case WarpPhase::Accelerating: {
      const double denom = std::max(1e-6, params_.accelerateTimeSec);
      travel_.stretch = math::smoothstep(travel_.phaseElapsedSec / denom);

      out.orientation = travel_.alignment;
      out.position = travel_.departure;
      travel_.currentPosition = travel_.departure;

      if (travel_.phaseElapsedSec >= params_.accelerateTimeSec) {
        travel_.stretch = 1.0;
        enterPhase(WarpPhase::Cruising, out);
      }
      break;
    }

    case WarpPhase::Cruising: {
      const double speed = cruiseSpeed();
      travel_.distanceRemaining = std::max(0.0, travel_.distanceRemaining - speed * dt);
      travel_.stretch = 1.0;

      const double p = progress();
      const math::Vec3d pos = math::lerp(travel_.departure, arrival, p);
      travel_.currentPosition = pos;

      out.orientation = travel_.alignment;
      out.position = pos;

      const bool withinLead = travel_.distanceRemaining <= 0.0
          || (speed > 0.0 && travel_.distanceRemaining / speed <= params_.decelerateLeadSec);
      if (withinLead) {
        travel_.decelerateFrom = pos;
        enterPhase(WarpPhase::Decelerating, out);
      }
      break;
    }

    case WarpPhase::Decelerating: {
      const double denom = std::max(1e-6, params_.decelerateTimeSec);
      const double t = math::clamp(travel_.phaseElapsedSec / denom, 0.0, 1.0);
      math::Vec3d pos = math::lerp(travel_.decelerateFrom, arrival, math::smoothstep(t));
      travel_.stretch = 1.0 - t;

      if (travel_.phaseElapsedSec >= params_.decelerateTimeSec) {
        pos = arrival;
        travel_.stretch = 0.0;
        enterPhase(WarpPhase::Arriving, out);
      }

      travel_.distanceRemaining = math::distance(pos, arrival);
      travel_.currentPosition = pos;
      out.orientation = travel_.alignment;
      out.position = pos;
      break;
    }

    case WarpPhase::Arriving: {
      travel_.distanceRemaining = 0.0;
      travel_.currentPosition = arrival;
      out.orientation = travel_.alignment;
      out.position = arrival;

      if (travel_.phaseElapsedSec >= params_.arrivalTimeSec) {
        const std::string name = travel_.destinationName;
        enterPhase(WarpPhase::Idle, out);
        out.arrived = true;
        resetTravel();
        STARHELM_LOG_INFO("Arrived at " + name);
      }
      break;
    }

    case WarpPhase::Idle:
      break;
  }

  return out;
}

std::string formatEta(double seconds) {
  if (!std::isfinite(seconds)) return "--:--";
  const long long total = static_cast<long long>(std::floor(std::max(0.0, seconds)));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld", total / 60, total % 60);
  return buf;
}

} // namespace starhelm::sim
