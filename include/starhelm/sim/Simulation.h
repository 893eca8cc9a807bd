#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/sim/DebrisField.h"
#include "starhelm/sim/Defense.h"
#include "starhelm/sim/Destinations.h"
#include "starhelm/sim/Destructible.h"
#include "starhelm/sim/Flight.h"
#include "starhelm/sim/Input.h"
#include "starhelm/sim/Scanner.h"
#include "starhelm/sim/ShipSystems.h"
#include "starhelm/sim/Snapshot.h"
#include "starhelm/sim/WarpDrive.h"
#include "starhelm/sim/Weapons.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starhelm::sim {

struct SimulationParams {
  FlightParams flight{};
  WarpParams warp{};
  WeaponParams weapons{};
  DestructibleParams destructible{};
  DefenseParams defense{};
  DebrisParams debris{};
  ScannerParams scanner{};
  ShipSystemsParams systems{};

  double maxDeltaSec{kDefaultMaxDeltaSec};
  double entityMaxHealth{100.0};
};

// The host frame loop. Each tick runs, in order:
// Flight, Warp, Weapons, Scanner, Destructible, Defense (debris collisions, shields,
// ship system power), then publishes a FrameSnapshot.
class Simulation {
public:
  explicit Simulation(const SimulationParams& params = {});

  // Registers one destructible entity per body. Returns how many were added.
  std::size_t populateFromCatalog(const std::vector<Destination>& catalog = solCatalog());
  bool addEntity(const Destination& body, std::string* outError = nullptr);

  // Selects a registered entity as the warp destination.
  bool setDestination(std::string_view key, std::string* outError = nullptr);
  void setDestination(const WarpDestination& destination) { warp_.setDestination(destination); }
  void clearDestination() { warp_.clearDestination(); }
  void setWarpLevel(int level) { warp_.setWarpLevel(level); }

  // Locks a specific entity (navigation / tooling). Same rules as cycling.
  bool lockTarget(std::string_view key);

  // Directed hazard damage arriving from `sourcePosition`.
  HitResult damageShip(double amount, const math::Vec3d& sourcePosition);

  // Host-forced combat (hostile contact); holds the alert at yellow or above.
  void setCombatActive(bool active) { defense_.setCombatActive(active); }

  bool damageSystem(std::string_view key, double amount, std::string* outError = nullptr) {
    return systems_.damageSystem(key, amount, outError);
  }
  bool repairSystem(std::string_view key, double amount, std::string* outError = nullptr) {
    return systems_.repairSystem(key, amount, outError);
  }
  bool toggleSystem(std::string_view key, std::optional<bool> active = std::nullopt,
                    std::string* outError = nullptr) {
    return systems_.toggleSystem(key, active, outError);
  }

  // Full shields and hull, green alert, every system back to its loadout.
  // Shows in the snapshot from the next tick.
  void resetShipSystems();

  // Advances one tick; dt is clamped to [0, maxDeltaSec].
  const FrameSnapshot& tick(double dtSeconds, const InputSnapshot& input);

  const FrameSnapshot& snapshot() const { return frame_; }
  double timeSec() const { return timeSec_; }
  core::u64 tickCount() const { return tick_; }
  const SimulationParams& params() const { return params_; }

  const FlightController& flight() const { return flight_; }
  FlightController& flight() { return flight_; }
  const WarpDrive& warp() const { return warp_; }
  const WeaponsSystem& weapons() const { return weapons_; }
  const EntityTable& entities() const { return entities_; }
  EntityTable& entities() { return entities_; }
  const DefenseSystem& defense() const { return defense_; }
  const DebrisField& debris() const { return debris_; }
  const Scanner& scanner() const { return scanner_; }
  const ShipSystems& systems() const { return systems_; }

private:
  void emit(EventType type, EntityId entity = kNoEntity, std::string detail = {}, double value = 0.0);
  std::string entityName(EntityId id) const;

  void stepFlight(double dt, const InputFrame& input);
  void stepWarp(double dt, const InputEdges& edges);
  void stepWeapons(double dt, const InputSnapshot& held, const InputEdges& edges);
  void stepScanner(double dt, const InputEdges& edges);
  void stepDestructible(double dt);
  void stepDefense(double dt);
  void publish(double dt);

  SimulationParams params_;

  FlightController flight_;
  WarpDrive warp_;
  WeaponsSystem weapons_;
  EntityTable entities_;
  DefenseSystem defense_;
  DebrisField debris_;
  Scanner scanner_;
  ShipSystems systems_;

  InputSnapshot prevInput_{};
  std::vector<SimEvent> events_;
  FrameSnapshot frame_{};
  double timeSec_{0.0};
  core::u64 tick_{0};
};

} // namespace starhelm::sim
