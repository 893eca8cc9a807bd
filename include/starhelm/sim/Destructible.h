#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Vec3.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace starhelm::sim {

// Stable id of a destructible body (fnv1a64 of its catalog key). 0 is never issued.
using EntityId = core::u64;
constexpr EntityId kNoEntity = 0;

enum class DamageState : core::u8 {
  Healthy = 0,
  Damaged,
  Critical,
  Exploding,
  Debris,
  Respawning,
};

const char* damageStateName(DamageState s);

// Exploding, Debris and Respawning: not damageable, not targetable.
inline bool isDestroyedState(DamageState s) {
  return s == DamageState::Exploding || s == DamageState::Debris || s == DamageState::Respawning;
}

struct DestructibleParams {
  double explosionDurationSec{2.0};
  double debrisDurationSec{30.0};
  double respawnDelaySec{120.0};   // recorded as respawnAtSec; informational
  double respawnFadeSec{2.0};

  double healthyAbovePct{70.0};
  double criticalAtOrBelowPct{30.0};
};

struct DestructibleEntity {
  EntityId id{kNoEntity};
  std::string name;
  math::Vec3d position{};
  double radius{0.0};

  double health{100.0};
  double maxHealth{100.0};
  DamageState state{DamageState::Healthy};

  // Simulation-clock timestamps (seconds), set while destroyed.
  std::optional<double> destroyedAtSec;
  std::optional<double> respawnAtSec;

  double explosionProgress{0.0}; // [0,1]
  double respawnProgress{0.0};   // [0,1]

  double healthPercent() const { return maxHealth > 0.0 ? (health / maxHealth) * 100.0 : 0.0; }
  bool targetable() const { return !isDestroyedState(state); }
};

// Health bucket for a live entity. A pure function of the health percentage.
DamageState classifyHealth(double health, double maxHealth, const DestructibleParams& params);

enum class LifecycleEventType : core::u8 {
  Destroyed,
  DebrisSettled,
  RespawnStarted,
  Respawned,
};

struct LifecycleEvent {
  LifecycleEventType type{LifecycleEventType::Destroyed};
  EntityId id{kNoEntity};
  math::Vec3d position{};
  double radius{0.0};
};

struct DamageResult {
  bool applied{false};
  double dealt{0.0};
  bool destroyed{false};  // this hit took the entity to zero
  DamageState state{DamageState::Healthy};
};

// Authoritative table of destructible bodies. Other systems keep ids, never
// pointers, and look entities up here every tick.
class EntityTable {
public:
  explicit EntityTable(const DestructibleParams& params = {});

  // Rejects id 0, duplicate ids and non-positive maxHealth.
  bool add(EntityId id,
           std::string name,
           const math::Vec3d& position,
           double radius,
           double maxHealth = 100.0,
           std::string* outError = nullptr);

  const DestructibleEntity* find(EntityId id) const;
  bool isTargetable(EntityId id) const;

  // No-op (applied=false) for unknown ids and destroyed-phase entities.
  // Negative / NaN amounts are treated as 0.
  DamageResult applyDamage(EntityId id, double amount);

  // Advances the simulation clock and every timed destruction phase.
  void update(double dtSeconds);

  // One-shot notifications accumulated since the last drain.
  std::vector<LifecycleEvent> drainEvents();

  const std::vector<DestructibleEntity>& entities() const { return entities_; }
  std::size_t size() const { return entities_.size(); }
  double nowSec() const { return nowSec_; }
  const DestructibleParams& params() const { return params_; }

private:
  DestructibleEntity* findMutable(EntityId id);
  void emit(LifecycleEventType type, const DestructibleEntity& e);

  DestructibleParams params_;
  std::vector<DestructibleEntity> entities_;
  std::unordered_map<EntityId, std::size_t> indexById_;
  std::vector<LifecycleEvent> events_;
  double nowSec_{0.0};
};

} // namespace starhelm::sim
