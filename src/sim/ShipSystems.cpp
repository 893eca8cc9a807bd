#include "starhelm/sim/ShipSystems.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace starhelm::sim {

const char* systemStatusName(SystemStatus s) {
  switch (s) {
    case SystemStatus::Online:  return "online";
    case SystemStatus::Damaged: return "damaged";
    case SystemStatus::Offline: return "offline";
  }
  return "unknown";
}

std::vector<ShipSystem> defaultShipSystems() {
  //       key            name                 status                 power  max    charge drain active
  return {
    {"warp",        "Warp Drive",        SystemStatus::Online, 100.0, 100.0,  5.0, 10.0, false},
    {"impulse",     "Impulse Engines",   SystemStatus::Online, 100.0, 100.0, 10.0,  5.0, false},
    {"shields",     "Deflector Shields", SystemStatus::Online, 100.0, 100.0,  2.0,  0.0, true},
    {"phasers",     "Phaser Array",      SystemStatus::Online, 100.0, 100.0,  8.0, 15.0, false},
    {"torpedoes",   "Torpedo Systems",   SystemStatus::Online, 100.0, 100.0,  5.0,  0.0, false},
    {"sensors",     "Sensor Array",      SystemStatus::Online, 100.0, 100.0, 15.0,  2.0, true},
    {"lifesupport", "Life Support",      SystemStatus::Online, 100.0, 100.0, 20.0,  1.0, true},
    {"computer",    "Main Computer",     SystemStatus::Online, 100.0, 100.0, 25.0,  3.0, true},
  };
}

SystemStatus classifyPower(double power, const ShipSystemsParams& params) {
  if (power <= 0.0) return SystemStatus::Offline;
  if (power < params.damagedBelowPower) return SystemStatus::Damaged;
  return SystemStatus::Online;
}

ShipSystems::ShipSystems(const ShipSystemsParams& params, std::vector<ShipSystem> loadout)
    : params_(params),
      loadout_(std::move(loadout)),
      systems_(loadout_),
      rng_(core::deriveSeed(params.seed, "ship-systems")) {}

const ShipSystem* ShipSystems::find(std::string_view key) const {
  for (const auto& s : systems_) {
    if (s.key == key) return &s;
  }
  return nullptr;
}

ShipSystem* ShipSystems::findMutable(std::string_view key) {
  for (auto& s : systems_) {
    if (s.key == key) return &s;
  }
  return nullptr;
}

void ShipSystems::setPower(ShipSystem& s, double power) {
  s.power = math::clamp(power, 0.0, std::max(0.0, s.maxPower));

  const SystemStatus next = classifyPower(s.power, params_);
  if (next == s.status) return;

  events_.push_back(SystemEvent{s.key, s.status, next, s.power});
  if (next == SystemStatus::Online) {
    STARHELM_LOG_INFO(s.name + " " + systemStatusName(next));
  } else {
    STARHELM_LOG_WARN(s.name + " " + systemStatusName(next));
  }
  s.status = next;
}

bool ShipSystems::damageSystem(std::string_view key, double amount, std::string* outError) {
  ShipSystem* s = findMutable(key);
  if (!s) {
    if (outError) *outError = "Unknown system '" + std::string(key) + "'.";
    return false;
  }
  amount = math::clampFinite(amount, 0.0, std::numeric_limits<double>::max());
  setPower(*s, s->power - amount);
  return true;
}

bool ShipSystems::repairSystem(std::string_view key, double amount, std::string* outError) {
  ShipSystem* s = findMutable(key);
  if (!s) {
    if (outError) *outError = "Unknown system '" + std::string(key) + "'.";
    return false;
  }
  amount = math::clampFinite(amount, 0.0, std::numeric_limits<double>::max());
  setPower(*s, s->power + amount);
  return true;
}

bool ShipSystems::toggleSystem(std::string_view key, std::optional<bool> active, std::string* outError) {
  ShipSystem* s = findMutable(key);
  if (!s) {
    if (outError) *outError = "Unknown system '" + std::string(key) + "'.";
    return false;
  }
  if (s->status == SystemStatus::Offline) {
    if (outError) *outError = s->name + " is offline.";
    return false;
  }
  s->active = active ? *active : !s->active;
  return true;
}

const ShipSystem* ShipSystems::absorbHullDamage(double hullDamage) {
  if (systems_.empty() || !(hullDamage > params_.hullSpillThreshold)) return nullptr;
  if (!(rng_.nextDouble01() < params_.hullSpillChance)) return nullptr;

  ShipSystem& hit = systems_[static_cast<std::size_t>(rng_.nextU64() % systems_.size())];
  STARHELM_LOG_DEBUG("Hull breach reached " + hit.name);
  setPower(hit, hit.power - hullDamage * params_.hullSpillFactor);
  return &hit;
}

void ShipSystems::update(double dtSeconds) {
  const double dt = std::max(0.0, dtSeconds);
  if (dt <= 0.0) return;

  for (auto& s : systems_) {
    if (s.status == SystemStatus::Offline) continue;
    const double rate = s.chargePerSec - (s.active ? s.drainPerSec : 0.0);
    setPower(s, s.power + rate * dt);
  }
}

void ShipSystems::reset() {
  systems_ = loadout_;
  rng_ = core::SplitMix64(core::deriveSeed(params_.seed, "ship-systems"));
  events_.clear();
}

std::vector<SystemEvent> ShipSystems::drainEvents() {
  std::vector<SystemEvent> out;
  out.swap(events_);
  return out;
}

} // namespace starhelm::sim
