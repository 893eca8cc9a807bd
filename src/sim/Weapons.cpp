#include "starhelm/sim/Weapons.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <cmath>

namespace starhelm::sim {

WeaponsSystem::WeaponsSystem(const WeaponParams& params) : params_(params) {
  params_.torpedoMaxAmmo = std::max(0, params_.torpedoMaxAmmo);
  state_.torpedoAmmo = std::clamp(params_.torpedoInitialAmmo, 0, params_.torpedoMaxAmmo);
}

void WeaponsSystem::setOnline(bool online) {
  if (online_ == online) return;
  online_ = online;
  if (!online_) {
    stopPhasers();
    STARHELM_LOG_DEBUG("Weapons offline");
  } else {
    STARHELM_LOG_DEBUG("Weapons online");
  }
}

bool WeaponsSystem::inRange(const DestructibleEntity& e, const math::Vec3d& shipPosition) const {
  return math::distance(shipPosition, e.position) <= params_.targetingRange;
}

void WeaponsSystem::setLock(const DestructibleEntity& e, const math::Vec3d& shipPosition) {
  const bool changed = !state_.lock || state_.lock->id != e.id;

  TargetLock lock;
  lock.id = e.id;
  lock.position = e.position;
  lock.distance = math::distance(shipPosition, e.position);
  state_.lock = lock;

  if (changed) {
    events_.push_back(WeaponEvent{WeaponEventType::TargetChanged, e.id, 0, 0.0});
    STARHELM_LOG_DEBUG("Target locked: " + e.name);
  }
}

bool WeaponsSystem::cycleTarget(const math::Vec3d& shipPosition, const EntityTable& table) {
  if (!online_) return false;

  struct Candidate {
    const DestructibleEntity* entity;
    double distance;
  };

  std::vector<Candidate> candidates;
  candidates.reserve(table.size());
  for (const auto& e : table.entities()) {
    if (!e.targetable()) continue;
    const double d = math::distance(shipPosition, e.position);
    if (d > params_.targetingRange) continue;
    candidates.push_back({&e, d});
  }
  if (candidates.empty()) return false;

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.entity->id < b.entity->id;
  });

  std::size_t next = 0;
  if (state_.lock) {
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (candidates[i].entity->id == state_.lock->id) {
        next = (i + 1) % candidates.size();
        break;
      }
    }
  }

  setLock(*candidates[next].entity, shipPosition);
  return true;
}

bool WeaponsSystem::lockTarget(EntityId id, const math::Vec3d& shipPosition, const EntityTable& table) {
  if (!online_) return false;
  const DestructibleEntity* e = table.find(id);
  if (!e || !e->targetable() || !inRange(*e, shipPosition)) return false;
  setLock(*e, shipPosition);
  return true;
}

void WeaponsSystem::clearTarget() {
  if (!state_.lock) return;
  const EntityId id = state_.lock->id;
  state_.lock.reset();
  stopPhasers();
  events_.push_back(WeaponEvent{WeaponEventType::TargetLost, id, 0, 0.0});
}

bool WeaponsSystem::firePhasers() {
  if (!online_ || state_.phaserOverheated || !state_.lock) {
    return false;
  }
  state_.firingPhasers = true;
  return true;
}

void WeaponsSystem::stopPhasers() {
  state_.firingPhasers = false;
}

bool WeaponsSystem::fireTorpedo(const math::Vec3d& shipPosition, std::string* outError) {
  if (!online_) {
    if (outError) *outError = "Weapons offline.";
    return false;
  }
  if (!state_.lock) {
    if (outError) *outError = "No target locked.";
    return false;
  }
  if (state_.torpedoAmmo <= 0) {
    if (outError) *outError = "Torpedo magazine empty.";
    return false;
  }
  if (state_.torpedoReloading()) {
    if (outError) *outError = "Torpedo tube reloading.";
    return false;
  }

  state_.torpedoAmmo -= 1;
  state_.torpedoReloadRemainingSec = std::max(1e-6, params_.torpedoReloadSec);

  Projectile p;
  p.id = nextProjectileId_++;
  p.position = shipPosition;
  p.aimPoint = state_.lock->position;
  p.targetId = state_.lock->id;
  p.speed = std::max(0.0, params_.torpedoSpeed);
  state_.projectiles.push_back(p);

  events_.push_back(WeaponEvent{WeaponEventType::TorpedoFired, p.targetId, p.id, 0.0});
  STARHELM_LOG_DEBUG("Torpedo " + std::to_string(p.id) + " away, "
                     + std::to_string(state_.torpedoAmmo) + " remaining");
  return true;
}

void WeaponsSystem::refreshLock(const math::Vec3d& shipPosition, const EntityTable& table) {
  if (!state_.lock) return;

  const DestructibleEntity* e = table.find(state_.lock->id);
  if (!e || !e->targetable() || !inRange(*e, shipPosition)) {
    clearTarget();
    return;
  }

  state_.lock->position = e->position;
  state_.lock->distance = math::distance(shipPosition, e->position);
}

void WeaponsSystem::updatePhasers(double dt, EntityTable& table) {
  WeaponState& s = state_;

  if (s.firingPhasers && s.lock) {
    s.phaserHeat += params_.phaserHeatPerSec * dt;
    table.applyDamage(s.lock->id, params_.phaserDps * dt);

    if (s.phaserHeat >= 100.0) {
      s.phaserHeat = 100.0;
      s.phaserOverheated = true;
      s.firingPhasers = false;
      events_.push_back(WeaponEvent{WeaponEventType::PhasersOverheated, s.lock->id, 0, 0.0});
      STARHELM_LOG_DEBUG("Phasers overheated");
    }
  } else {
    s.firingPhasers = false;
    s.phaserHeat = std::max(0.0, s.phaserHeat - params_.phaserCoolPerSec * dt);
    if (s.phaserOverheated && s.phaserHeat < params_.phaserRestartHeat) {
      s.phaserOverheated = false;
    }
  }

  s.phaserHeat = math::clamp(s.phaserHeat, 0.0, 100.0);
}

void WeaponsSystem::updateProjectiles(double dt, EntityTable& table) {
  auto& list = state_.projectiles;

  for (auto it = list.begin(); it != list.end();) {
    Projectile& p = *it;

    if (!table.isTargetable(p.targetId)) {
      events_.push_back(WeaponEvent{WeaponEventType::TorpedoLost, p.targetId, p.id, 0.0});
      it = list.erase(it);
      continue;
    }

    const math::Vec3d toAim = p.aimPoint - p.position;
    const double dist = toAim.length();
    const double step = p.speed * dt;

    if (dist <= step) {
      const DamageResult hit = table.applyDamage(p.targetId, params_.torpedoDamage);
      events_.push_back(WeaponEvent{WeaponEventType::TorpedoImpact, p.targetId, p.id, hit.dealt});
      STARHELM_LOG_DEBUG("Torpedo " + std::to_string(p.id) + " impact");
      it = list.erase(it);
      continue;
    }

    p.position += toAim * (step / dist);
    ++it;
  }
}

void WeaponsSystem::updateReload(double dt) {
  if (!state_.torpedoReloading()) return;

  state_.torpedoReloadRemainingSec -= dt;
  if (state_.torpedoReloadRemainingSec <= 0.0) {
    state_.torpedoReloadRemainingSec = 0.0;
    state_.torpedoAmmo = std::min(params_.torpedoMaxAmmo, state_.torpedoAmmo + 1);
  }
}

void WeaponsSystem::update(double dtSeconds, const math::Vec3d& shipPosition, EntityTable& table) {
  const double dt = std::max(0.0, dtSeconds);

  refreshLock(shipPosition, table);
  updatePhasers(dt, table);
  updateProjectiles(dt, table);
  updateReload(dt);

  // This tick's beam or impact may have destroyed the locked entity.
  if (state_.lock && !table.isTargetable(state_.lock->id)) {
    STARHELM_LOG_DEBUG("Locked target destroyed");
    clearTarget();
  }
}

std::vector<WeaponEvent> WeaponsSystem::drainEvents() {
  std::vector<WeaponEvent> out;
  out.swap(events_);
  return out;
}

} // namespace starhelm::sim
