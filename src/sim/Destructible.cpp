#include "starhelm/sim/Destructible.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace starhelm::sim {

const char* damageStateName(DamageState s) {
  switch (s) {
    case DamageState::Healthy:    return "healthy";
    case DamageState::Damaged:    return "damaged";
    case DamageState::Critical:   return "critical";
    case DamageState::Exploding:  return "exploding";
    case DamageState::Debris:     return "debris";
    case DamageState::Respawning: return "respawning";
  }
  return "unknown";
}

DamageState classifyHealth(double health, double maxHealth, const DestructibleParams& params) {
  if (maxHealth <= 0.0) return DamageState::Exploding;
  const double pct = (health / maxHealth) * 100.0;
  if (pct > params.healthyAbovePct) return DamageState::Healthy;
  if (pct > params.criticalAtOrBelowPct) return DamageState::Damaged;
  if (pct > 0.0) return DamageState::Critical;
  return DamageState::Exploding;
}

EntityTable::EntityTable(const DestructibleParams& params) : params_(params) {}

bool EntityTable::add(EntityId id,
                      std::string name,
                      const math::Vec3d& position,
                      double radius,
                      double maxHealth,
                      std::string* outError) {
  if (id == kNoEntity) {
    if (outError) *outError = "entity id 0 is reserved";
    return false;
  }
  if (!(maxHealth > 0.0) || !std::isfinite(maxHealth)) {
    if (outError) *outError = "maxHealth must be positive for '" + name + "'";
    return false;
  }
  if (indexById_.count(id) != 0) {
    if (outError) *outError = "duplicate entity id for '" + name + "'";
    STARHELM_LOG_WARN("EntityTable: duplicate entity '" + name + "' ignored");
    return false;
  }

  DestructibleEntity e;
  e.id = id;
  e.name = std::move(name);
  e.position = position;
  e.radius = std::max(0.0, radius);
  e.maxHealth = maxHealth;
  e.health = maxHealth;
  e.state = DamageState::Healthy;

  indexById_.emplace(id, entities_.size());
  entities_.push_back(std::move(e));
  return true;
}

const DestructibleEntity* EntityTable::find(EntityId id) const {
  const auto it = indexById_.find(id);
  if (it == indexById_.end()) return nullptr;
  return &entities_[it->second];
}

DestructibleEntity* EntityTable::findMutable(EntityId id) {
  const auto it = indexById_.find(id);
  if (it == indexById_.end()) return nullptr;
  return &entities_[it->second];
}

bool EntityTable::isTargetable(EntityId id) const {
  const DestructibleEntity* e = find(id);
  return e && e->targetable();
}

void EntityTable::emit(LifecycleEventType type, const DestructibleEntity& e) {
  events_.push_back(LifecycleEvent{type, e.id, e.position, e.radius});
}

DamageResult EntityTable::applyDamage(EntityId id, double amount) {
  DamageResult r;
  DestructibleEntity* e = findMutable(id);
  if (!e) return r;

  r.state = e->state;
  if (isDestroyedState(e->state)) return r;

  amount = math::clampFinite(amount, 0.0, std::numeric_limits<double>::max());

  const double before = e->health;
  e->health = std::max(0.0, e->health - amount);
  r.applied = true;
  r.dealt = before - e->health;

  if (e->health <= 0.0 && before > 0.0) {
    e->health = 0.0;
    e->state = DamageState::Exploding;
    e->destroyedAtSec = nowSec_;
    e->respawnAtSec = nowSec_ + params_.respawnDelaySec;
    e->explosionProgress = 0.0;
    e->respawnProgress = 0.0;
    r.destroyed = true;
    emit(LifecycleEventType::Destroyed, *e);
    STARHELM_LOG_INFO(e->name + " destroyed");
  } else {
    e->state = classifyHealth(e->health, e->maxHealth, params_);
  }

  r.state = e->state;
  return r;
}

void EntityTable::update(double dtSeconds) {
  const double dt = std::max(0.0, dtSeconds);
  nowSec_ += dt;

  const double explosion = std::max(1e-6, params_.explosionDurationSec);
  const double fade = std::max(1e-6, params_.respawnFadeSec);

  for (auto& e : entities_) {
    switch (e.state) {
      case DamageState::Exploding: {
        e.explosionProgress = std::min(1.0, e.explosionProgress + dt / explosion);
        if (e.explosionProgress >= 1.0) {
          e.state = DamageState::Debris;
          emit(LifecycleEventType::DebrisSettled, e);
        }
        break;
      }
      case DamageState::Debris: {
        const double destroyedAt = e.destroyedAtSec.value_or(nowSec_);
        const double debrisEnd = destroyedAt + params_.explosionDurationSec + params_.debrisDurationSec;
        if (nowSec_ >= debrisEnd) {
          e.state = DamageState::Respawning;
          e.respawnProgress = 0.0;
          emit(LifecycleEventType::RespawnStarted, e);
        }
        break;
      }
      case DamageState::Respawning: {
        e.respawnProgress = std::min(1.0, e.respawnProgress + dt / fade);
        if (e.respawnProgress >= 1.0) {
          e.health = e.maxHealth;
          e.state = DamageState::Healthy;
          e.destroyedAtSec.reset();
          e.respawnAtSec.reset();
          e.explosionProgress = 0.0;
          e.respawnProgress = 0.0;
          emit(LifecycleEventType::Respawned, e);
          STARHELM_LOG_INFO(e.name + " restored");
        }
        break;
      }
      default:
        break;
    }
  }
}

std::vector<LifecycleEvent> EntityTable::drainEvents() {
  std::vector<LifecycleEvent> out;
  out.swap(events_);
  return out;
}

} // namespace starhelm::sim
