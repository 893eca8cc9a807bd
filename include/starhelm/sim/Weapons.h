#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Destructible.h"

#include <optional>
#include <string>
#include <vector>

namespace starhelm::sim {

struct WeaponParams {
  double targetingRange{2000.0};

  // Phaser (beam): heat in percent.
  double phaserHeatPerSec{25.0};
  double phaserCoolPerSec{15.0};
  double phaserRestartHeat{25.0};   // overheat clears once heat falls below this
  double phaserDps{10.0};

  // Photon torpedoes.
  int torpedoMaxAmmo{100};
  int torpedoInitialAmmo{100};
  double torpedoReloadSec{2.0};
  double torpedoSpeed{120.0};       // units/s
  double torpedoDamage{25.0};
};

// Weak reference: the entity is looked up by id every tick.
struct TargetLock {
  EntityId id{kNoEntity};
  double distance{0.0};
  math::Vec3d position{};
};

struct Projectile {
  core::u64 id{0};
  math::Vec3d position{};
  math::Vec3d aimPoint{};           // lock position captured at launch
  EntityId targetId{kNoEntity};
  double speed{0.0};
};

struct WeaponState {
  double phaserHeat{0.0};           // [0,100]
  bool phaserOverheated{false};
  bool firingPhasers{false};

  int torpedoAmmo{0};
  double torpedoReloadRemainingSec{0.0};

  std::optional<TargetLock> lock;
  std::vector<Projectile> projectiles;

  bool torpedoReloading() const { return torpedoReloadRemainingSec > 0.0; }
};

enum class WeaponEventType : core::u8 {
  TargetChanged,
  TargetLost,
  PhasersOverheated,
  TorpedoFired,
  TorpedoImpact,
  TorpedoLost,
};

struct WeaponEvent {
  WeaponEventType type{WeaponEventType::TargetChanged};
  EntityId targetId{kNoEntity};
  core::u64 projectileId{0};
  double damage{0.0};
};

class WeaponsSystem {
public:
  explicit WeaponsSystem(const WeaponParams& params = {});

  // Offline weapons refuse every firing and targeting call; going offline stops the beam.
  void setOnline(bool online);
  bool online() const { return online_; }

  // Next valid entity by distance after the current lock, wrapping to the nearest.
  // Returns false (and changes nothing) when nothing is in range.
  bool cycleTarget(const math::Vec3d& shipPosition, const EntityTable& table);

  // Locks a specific entity if it is targetable and in range.
  bool lockTarget(EntityId id, const math::Vec3d& shipPosition, const EntityTable& table);
  void clearTarget();

  // Returns whether the beam is firing after the call.
  bool firePhasers();
  void stopPhasers();

  bool fireTorpedo(const math::Vec3d& shipPosition, std::string* outError = nullptr);

  // Refreshes the lock, integrates heat and beam damage, moves projectiles and reloads.
  void update(double dtSeconds, const math::Vec3d& shipPosition, EntityTable& table);

  const WeaponState& state() const { return state_; }
  const WeaponParams& params() const { return params_; }

  std::vector<WeaponEvent> drainEvents();

private:
  bool inRange(const DestructibleEntity& e, const math::Vec3d& shipPosition) const;
  void setLock(const DestructibleEntity& e, const math::Vec3d& shipPosition);
  void refreshLock(const math::Vec3d& shipPosition, const EntityTable& table);
  void updatePhasers(double dt, EntityTable& table);
  void updateProjectiles(double dt, EntityTable& table);
  void updateReload(double dt);

  WeaponParams params_;
  WeaponState state_{};
  bool online_{true};
  core::u64 nextProjectileId_{1};
  std::vector<WeaponEvent> events_;
};

} // namespace starhelm::sim
