#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Quat.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Defense.h"
#include "starhelm/sim/Destructible.h"
#include "starhelm/sim/Scanner.h"
#include "starhelm/sim/ShipSystems.h"
#include "starhelm/sim/WarpDrive.h"

#include <array>
#include <string>
#include <vector>

namespace starhelm::sim {

// Read-only views handed to rendering / audio / UI once per tick.

struct ShipSnapshot {
  math::Vec3d position{};
  math::Quatd orientation{};
  double throttlePercent{0.0};
  double targetThrottlePercent{0.0};
  double speed{0.0};

  WarpPhase warpPhase{WarpPhase::Idle};
  int warpLevel{1};
  double warpProgress{0.0};
  double distanceRemaining{0.0};
  double etaSec{0.0};
  double stretch{0.0};
  std::string destinationName;
};

struct WeaponsSnapshot {
  bool online{true};
  double phaserHeat{0.0};
  bool phaserOverheated{false};
  bool firingPhasers{false};

  int torpedoAmmo{0};
  int torpedoMaxAmmo{0};
  bool torpedoReloading{false};

  EntityId targetId{kNoEntity};
  std::string targetName;
  double targetDistance{0.0};

  std::vector<math::Vec3d> projectilePositions;
};

struct DefenseSnapshot {
  std::array<double, kShieldQuadrantCount> shields{};
  double hull{100.0};
  AlertLevel alert{AlertLevel::Green};
  bool combatActive{false};
};

struct SystemSnapshot {
  std::string key;
  std::string name;
  SystemStatus status{SystemStatus::Online};
  double power{100.0};
  bool active{false};
};

struct EntitySnapshot {
  EntityId id{kNoEntity};
  std::string name;
  math::Vec3d position{};
  double radius{0.0};
  double healthPercent{100.0};
  DamageState state{DamageState::Healthy};
  double explosionProgress{0.0};
  double respawnProgress{0.0};
};

struct ScannerSnapshot {
  ScanStatus status{ScanStatus::Idle};
  EntityId targetId{kNoEntity};
  std::string targetName;
  double progress{0.0};
  std::string error;
};

enum class EventType : core::u8 {
  WarpPhaseChanged,
  WarpArrived,
  WarpEmergencyStop,
  WarpEngageRejected,
  TargetChanged,
  TargetLost,
  PhasersOverheated,
  TorpedoFired,
  TorpedoRejected,
  TorpedoImpact,
  EntityDestroyed,
  EntityRespawned,
  ShieldCollapsed,
  HullDamaged,
  DebrisCollision,
  ScanComplete,
  ScanFailed,
  AlertChanged,
  SystemDamaged,
  SystemStatusChanged,
};

const char* eventTypeName(EventType t);

// One-shot notification raised during a tick.
struct SimEvent {
  EventType type{EventType::WarpPhaseChanged};
  EntityId entity{kNoEntity};
  std::string detail;
  double value{0.0};
};

struct FrameSnapshot {
  core::u64 tick{0};
  double timeSec{0.0};
  double dtSec{0.0};

  ShipSnapshot ship{};
  WeaponsSnapshot weapons{};
  DefenseSnapshot defense{};
  ScannerSnapshot scanner{};
  std::vector<SystemSnapshot> systems;
  std::vector<EntitySnapshot> entities;

  std::vector<SimEvent> events;

  bool hasEvent(EventType t) const {
    for (const auto& e : events) {
      if (e.type == t) return true;
    }
    return false;
  }
};

} // namespace starhelm::sim
