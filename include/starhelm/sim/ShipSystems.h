#pragma once

#include "starhelm/core/Random.h"
#include "starhelm/core/Types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starhelm::sim {

enum class SystemStatus : core::u8 {
  Online = 0,
  Damaged,
  Offline,
};

const char* systemStatusName(SystemStatus s);

// One powered ship system. Power is in percent of maxPower.
struct ShipSystem {
  std::string key;
  std::string name;
  SystemStatus status{SystemStatus::Online};
  double power{100.0};
  double maxPower{100.0};
  double chargePerSec{0.0};
  double drainPerSec{0.0};   // applied on top of charging while active
  bool active{false};
};

// Stock loadout: warp, impulse, shields, phasers, torpedoes, sensors, life support, computer.
std::vector<ShipSystem> defaultShipSystems();

struct ShipSystemsParams {
  double damagedBelowPower{50.0};

  // Hull hits above the threshold may knock one system, picked from a seeded stream.
  double hullSpillThreshold{5.0};
  double hullSpillChance{0.3};
  double hullSpillFactor{0.5};

  core::u64 seed{0x53484950ull};
};

// 0 -> offline, below damagedBelowPower -> damaged, otherwise online.
SystemStatus classifyPower(double power, const ShipSystemsParams& params);

struct SystemEvent {
  std::string key;
  SystemStatus from{SystemStatus::Online};
  SystemStatus to{SystemStatus::Online};
  double power{0.0};
};

class ShipSystems {
public:
  explicit ShipSystems(const ShipSystemsParams& params = {},
                       std::vector<ShipSystem> loadout = defaultShipSystems());

  const ShipSystem* find(std::string_view key) const;

  // Negative / NaN amounts count as 0. Unknown keys are rejected.
  bool damageSystem(std::string_view key, double amount, std::string* outError = nullptr);
  bool repairSystem(std::string_view key, double amount, std::string* outError = nullptr);

  // Flips the active flag, or sets it when a value is given. Offline systems refuse.
  bool toggleSystem(std::string_view key, std::optional<bool> active = std::nullopt,
                    std::string* outError = nullptr);

  // Returns the system hit by the spill, or nullptr.
  const ShipSystem* absorbHullDamage(double hullDamage);

  // Offline systems stay offline until repaired.
  void update(double dtSeconds);

  // Back to the loadout; the spill stream restarts from its seed.
  void reset();

  const std::vector<ShipSystem>& systems() const { return systems_; }
  const ShipSystemsParams& params() const { return params_; }

  std::vector<SystemEvent> drainEvents();

private:
  ShipSystem* findMutable(std::string_view key);
  void setPower(ShipSystem& s, double power);

  ShipSystemsParams params_;
  std::vector<ShipSystem> loadout_;
  std::vector<ShipSystem> systems_;
  core::SplitMix64 rng_;
  std::vector<SystemEvent> events_;
};

} // namespace starhelm::sim
