#include "starhelm/sim/Defense.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace starhelm::sim {

const char* shieldQuadrantName(ShieldQuadrant q) {
  switch (q) {
    case ShieldQuadrant::Fore:      return "fore";
    case ShieldQuadrant::Aft:       return "aft";
    case ShieldQuadrant::Port:      return "port";
    case ShieldQuadrant::Starboard: return "starboard";
  }
  return "unknown";
}

const char* alertLevelName(AlertLevel a) {
  switch (a) {
    case AlertLevel::Green:  return "green";
    case AlertLevel::Yellow: return "yellow";
    case AlertLevel::Red:    return "red";
  }
  return "unknown";
}

ShieldQuadrant quadrantFor(const math::Quatd& orientation,
                           const math::Vec3d& shipPosition,
                           const math::Vec3d& sourcePosition) {
  const math::Vec3d world = sourcePosition - shipPosition;
  if (world.lengthSquared() <= 0.0) return ShieldQuadrant::Fore;

  const math::Vec3d local = orientation.normalized().conjugate().rotate(world);

  if (std::abs(local.z) >= std::abs(local.x)) {
    return (local.z <= 0.0) ? ShieldQuadrant::Fore : ShieldQuadrant::Aft;
  }
  return (local.x < 0.0) ? ShieldQuadrant::Port : ShieldQuadrant::Starboard;
}

DefenseSystem::DefenseSystem(const DefenseParams& params) : params_(params) {}

void DefenseSystem::reset() {
  state_ = DefenseState{};
  lastCombatSec_.reset();
  combatForced_ = false;
  events_.clear();
}

HitResult DefenseSystem::absorb(double amount, ShieldQuadrant quadrant) {
  HitResult r;
  auto& shield = state_.shields[static_cast<std::size_t>(quadrant)];

  const double before = shield.strength;
  r.absorbed = std::min(before, amount);
  shield.strength = math::clamp(before - r.absorbed, 0.0, 100.0);
  shield.lastHitSec = nowSec_;

  const double overflow = amount - r.absorbed;
  if (overflow > 0.0) {
    const double hullBefore = state_.hull;
    state_.hull = math::clamp(hullBefore - overflow, 0.0, 100.0);
    r.hullDamage = hullBefore - state_.hull;
  }

  if (before > 0.0 && shield.strength <= 0.0) {
    r.shieldCollapsed = true;
    events_.push_back(DefenseEvent{DefenseEventType::ShieldCollapsed, quadrant, 0.0, state_.alert});
    STARHELM_LOG_INFO(std::string(shieldQuadrantName(quadrant)) + " shields collapsed");
  }
  if (r.hullDamage > 0.0) {
    events_.push_back(DefenseEvent{DefenseEventType::HullDamaged, quadrant, r.hullDamage, state_.alert});
  }
  return r;
}

HitResult DefenseSystem::applyDamage(double amount, ShieldQuadrant quadrant) {
  amount = math::clampFinite(amount, 0.0, std::numeric_limits<double>::max());
  if (amount <= 0.0) return {};
  noteCombat();
  return absorb(amount, quadrant);
}

HitResult DefenseSystem::applyDamageOmni(double amount) {
  amount = math::clampFinite(amount, 0.0, std::numeric_limits<double>::max());
  if (amount <= 0.0) return {};
  noteCombat();

  const double share = amount / static_cast<double>(kShieldQuadrantCount);
  HitResult total;
  for (std::size_t i = 0; i < kShieldQuadrantCount; ++i) {
    const HitResult r = absorb(share, static_cast<ShieldQuadrant>(i));
    total.absorbed += r.absorbed;
    total.hullDamage += r.hullDamage;
    total.shieldCollapsed = total.shieldCollapsed || r.shieldCollapsed;
  }
  return total;
}

HitResult DefenseSystem::applyCollision(const math::Quatd& orientation,
                                        const math::Vec3d& shipPosition,
                                        const math::Vec3d& impactPosition) {
  return applyDamage(params_.collisionDamage, quadrantFor(orientation, shipPosition, impactPosition));
}

bool DefenseSystem::clearsWithMargin() const {
  const double h = params_.alertHysteresisPct;
  if (state_.combatActive) return false;
  if (state_.hull < params_.hullYellowPct + h) return false;
  for (const auto& q : state_.shields) {
    if (q.strength < params_.shieldCautionPct + h) return false;
  }
  return true;
}

AlertLevel DefenseSystem::deriveAlert() const {
  bool anyCritical = false;
  bool anyCaution = false;
  for (const auto& q : state_.shields) {
    anyCritical = anyCritical || q.strength < params_.shieldCriticalPct;
    anyCaution = anyCaution || q.strength < params_.shieldCautionPct;
  }

  if (anyCritical || state_.hull < params_.hullRedPct) return AlertLevel::Red;
  if (state_.hull < params_.hullYellowPct || anyCaution || state_.combatActive) return AlertLevel::Yellow;

  // Green only once every input is clear by the hysteresis margin.
  if (state_.alert != AlertLevel::Green && !clearsWithMargin()) return AlertLevel::Yellow;
  return AlertLevel::Green;
}

void DefenseSystem::update(double dtSeconds) {
  const double dt = std::max(0.0, dtSeconds);
  nowSec_ += dt;

  for (auto& q : state_.shields) {
    const bool cooling = q.lastHitSec && (nowSec_ - *q.lastHitSec) < params_.shieldRechargeDelaySec;
    if (!cooling) {
      q.strength = math::clamp(q.strength + params_.shieldRechargePerSec * dt, 0.0, 100.0);
    }
  }

  state_.combatActive = combatForced_
      || (lastCombatSec_ && (nowSec_ - *lastCombatSec_) < params_.combatWindowSec);

  const AlertLevel next = deriveAlert();
  if (next != state_.alert) {
    STARHELM_LOG_INFO(std::string("Alert: ") + alertLevelName(state_.alert) + " -> " + alertLevelName(next));
    state_.alert = next;
    events_.push_back(DefenseEvent{DefenseEventType::AlertChanged, ShieldQuadrant::Fore, 0.0, next});
  }
}

std::vector<DefenseEvent> DefenseSystem::drainEvents() {
  std::vector<DefenseEvent> out;
  out.swap(events_);
  return out;
}

} // namespace starhelm::sim
