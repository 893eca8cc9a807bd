#include "starhelm/sim/Simulation.h"

#include "starhelm/core/Log.h"

#include <string>
#include <utility>

namespace starhelm::sim {

Simulation::Simulation(const SimulationParams& params)
    : params_(params),
      flight_(params.flight),
      warp_(params.warp),
      weapons_(params.weapons),
      entities_(params.destructible),
      defense_(params.defense),
      debris_(params.debris),
      scanner_(params.scanner),
      systems_(params.systems) {
  publish(0.0);
}

std::size_t Simulation::populateFromCatalog(const std::vector<Destination>& catalog) {
  std::size_t added = 0;
  for (const auto& body : catalog) {
    std::string err;
    if (addEntity(body, &err)) {
      ++added;
    } else {
      STARHELM_LOG_DEBUG("Skipping catalog body '" + body.key + "': " + err);
    }
  }
  STARHELM_LOG_INFO("Registered " + std::to_string(added) + " destructible bodies");
  publish(0.0);
  return added;
}

bool Simulation::addEntity(const Destination& body, std::string* outError) {
  return entities_.add(entityIdFor(body.key), body.name, body.position, body.radius,
                       params_.entityMaxHealth, outError);
}

bool Simulation::setDestination(std::string_view key, std::string* outError) {
  const DestructibleEntity* e = entities_.find(entityIdFor(key));
  if (!e) {
    if (outError) *outError = "Unknown destination '" + std::string(key) + "'.";
    return false;
  }

  WarpDestination d;
  d.id = e->id;
  d.name = e->name;
  d.position = e->position;
  d.radius = e->radius;
  warp_.setDestination(d);
  return true;
}

bool Simulation::lockTarget(std::string_view key) {
  return weapons_.lockTarget(entityIdFor(key), flight_.state().position, entities_);
}

HitResult Simulation::damageShip(double amount, const math::Vec3d& sourcePosition) {
  const ShipKinematics& ship = flight_.state();
  return defense_.applyDamage(amount, quadrantFor(ship.orientation, ship.position, sourcePosition));
}

void Simulation::resetShipSystems() {
  defense_.reset();
  systems_.reset();
  STARHELM_LOG_INFO("Ship systems reset");
}

void Simulation::emit(EventType type, EntityId entity, std::string detail, double value) {
  events_.push_back(SimEvent{type, entity, std::move(detail), value});
}

std::string Simulation::entityName(EntityId id) const {
  const DestructibleEntity* e = entities_.find(id);
  return e ? e->name : std::string{};
}

const FrameSnapshot& Simulation::tick(double dtSeconds, const InputSnapshot& input) {
  const double dt = clampDelta(dtSeconds, params_.maxDeltaSec);

  InputFrame frame;
  frame.held = input.sanitized();
  frame.pressed = detectEdges(frame.held, prevInput_);
  prevInput_ = frame.held;

  events_.clear();
  ++tick_;

  // Cancellation is immediate: nothing below advances warp travel this tick.
  if (frame.pressed.emergencyStop) {
    if (warp_.emergencyStop()) {
      flight_.setWarpOverride(false);
      emit(EventType::WarpEmergencyStop);
    }
    flight_.fullStop();
    // A held throttle does not spool back up on the stop tick.
    frame.held.throttleAxis = 0.0;
  }

  stepFlight(dt, frame);
  stepWarp(dt, frame.pressed);
  stepWeapons(dt, frame.held, frame.pressed);
  stepScanner(dt, frame.pressed);
  stepDestructible(dt);
  stepDefense(dt);

  timeSec_ += dt;
  publish(dt);
  return frame_;
}

void Simulation::stepFlight(double dt, const InputFrame& input) {
  flight_.update(dt, input);
}

void Simulation::stepWarp(double dt, const InputEdges& edges) {
  if (flight_.warpEngageRequested()) {
    std::string err;
    if (!warp_.engage(flight_.state(), &err)) {
      STARHELM_LOG_INFO("Unable to engage warp: " + err);
      emit(EventType::WarpEngageRejected, kNoEntity, err);
    }
  }
  if (edges.skipToDestination) {
    warp_.skipToDestination();
  }

  const WarpOutput out = warp_.update(dt, flight_.state());
  if (out.orientation) flight_.overrideOrientation(*out.orientation);
  if (out.position) flight_.overridePosition(*out.position, dt);
  flight_.setWarpOverride(!warp_.idle());

  if (out.phaseChanged) {
    emit(EventType::WarpPhaseChanged, warp_.travel().destinationId,
         std::string(warpPhaseName(out.fromPhase)) + "->" + warpPhaseName(out.toPhase));
  }
  if (out.arrived) {
    emit(EventType::WarpArrived);
  }
}

void Simulation::stepWeapons(double dt, const InputSnapshot& held, const InputEdges& edges) {
  const math::Vec3d shipPos = flight_.state().position;

  weapons_.setOnline(warp_.idle());

  if (edges.cycleTarget) {
    weapons_.cycleTarget(shipPos, entities_);
  }
  if (held.firePhasers) {
    weapons_.firePhasers();
  }
  if (edges.firePhasersReleased) {
    weapons_.stopPhasers();
  }
  if (edges.fireTorpedo) {
    std::string err;
    if (!weapons_.fireTorpedo(shipPos, &err)) {
      STARHELM_LOG_DEBUG("Torpedo not fired: " + err);
      emit(EventType::TorpedoRejected, kNoEntity, err);
    }
  }

  weapons_.update(dt, shipPos, entities_);

  if (weapons_.state().firingPhasers) defense_.noteCombat();

  for (const auto& ev : weapons_.drainEvents()) {
    switch (ev.type) {
      case WeaponEventType::TargetChanged:
        emit(EventType::TargetChanged, ev.targetId, entityName(ev.targetId));
        break;
      case WeaponEventType::TargetLost:
        emit(EventType::TargetLost, ev.targetId, entityName(ev.targetId));
        break;
      case WeaponEventType::PhasersOverheated:
        emit(EventType::PhasersOverheated, ev.targetId);
        break;
      case WeaponEventType::TorpedoFired:
        defense_.noteCombat();
        emit(EventType::TorpedoFired, ev.targetId, entityName(ev.targetId));
        break;
      case WeaponEventType::TorpedoImpact:
        emit(EventType::TorpedoImpact, ev.targetId, entityName(ev.targetId), ev.damage);
        break;
      case WeaponEventType::TorpedoLost:
        break;
    }
  }
}

void Simulation::stepScanner(double dt, const InputEdges& edges) {
  const math::Vec3d shipPos = flight_.state().position;

  scanner_.setOnline(warp_.idle());

  if (edges.scan) {
    std::string err;
    if (!scanner_.startScan(shipPos, entities_, &err)) {
      STARHELM_LOG_DEBUG("Scan not started: " + err);
    }
  }

  const bool wasScanning = scanner_.state().status == ScanStatus::Scanning;
  if (scanner_.update(dt, shipPos, entities_)) {
    emit(EventType::ScanComplete, scanner_.state().targetId, entityName(scanner_.state().targetId));
  } else if (wasScanning && scanner_.state().status == ScanStatus::Failed) {
    emit(EventType::ScanFailed, scanner_.state().targetId, scanner_.state().error);
  }
}

void Simulation::stepDestructible(double dt) {
  entities_.update(dt);

  for (const auto& ev : entities_.drainEvents()) {
    switch (ev.type) {
      case LifecycleEventType::Destroyed:
        debris_.spawn(ev.id, ev.position, ev.radius);
        emit(EventType::EntityDestroyed, ev.id, entityName(ev.id));
        break;
      case LifecycleEventType::RespawnStarted:
        debris_.clear(ev.id);
        break;
      case LifecycleEventType::Respawned:
        emit(EventType::EntityRespawned, ev.id, entityName(ev.id));
        break;
      case LifecycleEventType::DebrisSettled:
        break;
    }
  }
}

void Simulation::stepDefense(double dt) {
  const ShipKinematics& ship = flight_.state();

  if (const auto hit = debris_.update(dt, ship.position)) {
    defense_.applyCollision(ship.orientation, ship.position, hit->position);
    emit(EventType::DebrisCollision, hit->source, entityName(hit->source), defense_.params().collisionDamage);
  }

  defense_.update(dt);

  for (const auto& ev : defense_.drainEvents()) {
    switch (ev.type) {
      case DefenseEventType::ShieldCollapsed:
        emit(EventType::ShieldCollapsed, kNoEntity, shieldQuadrantName(ev.quadrant));
        break;
      case DefenseEventType::HullDamaged:
        emit(EventType::HullDamaged, kNoEntity, shieldQuadrantName(ev.quadrant), ev.amount);
        if (const ShipSystem* hit = systems_.absorbHullDamage(ev.amount)) {
          emit(EventType::SystemDamaged, kNoEntity, hit->name, ev.amount * systems_.params().hullSpillFactor);
        }
        break;
      case DefenseEventType::AlertChanged:
        emit(EventType::AlertChanged, kNoEntity, alertLevelName(ev.alert));
        break;
    }
  }

  systems_.update(dt);

  for (const auto& ev : systems_.drainEvents()) {
    emit(EventType::SystemStatusChanged, kNoEntity,
         ev.key + " " + systemStatusName(ev.from) + "->" + systemStatusName(ev.to), ev.power);
  }
}

void Simulation::publish(double dt) {
  FrameSnapshot f;
  f.tick = tick_;
  f.timeSec = timeSec_;
  f.dtSec = dt;

  const ShipKinematics& k = flight_.state();
  f.ship.position = k.position;
  f.ship.orientation = k.orientation;
  f.ship.throttlePercent = k.throttlePercent;
  f.ship.targetThrottlePercent = k.targetThrottlePercent;
  f.ship.speed = k.speed();
  f.ship.warpPhase = warp_.phase();
  f.ship.warpLevel = warp_.warpLevel();
  f.ship.warpProgress = warp_.progress();
  f.ship.distanceRemaining = warp_.distanceRemaining();
  f.ship.etaSec = warp_.etaSec();
  f.ship.stretch = warp_.stretch();
  if (!warp_.idle()) {
    f.ship.destinationName = warp_.travel().destinationName;
  } else if (warp_.destination()) {
    f.ship.destinationName = warp_.destination()->name;
  }

  const WeaponState& w = weapons_.state();
  f.weapons.online = weapons_.online();
  f.weapons.phaserHeat = w.phaserHeat;
  f.weapons.phaserOverheated = w.phaserOverheated;
  f.weapons.firingPhasers = w.firingPhasers;
  f.weapons.torpedoAmmo = w.torpedoAmmo;
  f.weapons.torpedoMaxAmmo = weapons_.params().torpedoMaxAmmo;
  f.weapons.torpedoReloading = w.torpedoReloading();
  if (w.lock) {
    f.weapons.targetId = w.lock->id;
    f.weapons.targetName = entityName(w.lock->id);
    f.weapons.targetDistance = w.lock->distance;
  }
  f.weapons.projectilePositions.reserve(w.projectiles.size());
  for (const auto& p : w.projectiles) f.weapons.projectilePositions.push_back(p.position);

  const DefenseState& d = defense_.state();
  for (std::size_t i = 0; i < kShieldQuadrantCount; ++i) f.defense.shields[i] = d.shields[i].strength;
  f.defense.hull = d.hull;
  f.defense.alert = d.alert;
  f.defense.combatActive = d.combatActive;

  const ScannerState& s = scanner_.state();
  f.scanner.status = s.status;
  f.scanner.targetId = s.targetId;
  f.scanner.targetName = entityName(s.targetId);
  f.scanner.progress = s.progress;
  f.scanner.error = s.error;

  f.systems.reserve(systems_.systems().size());
  for (const auto& sys : systems_.systems()) {
    f.systems.push_back(SystemSnapshot{sys.key, sys.name, sys.status, sys.power, sys.active});
  }

  f.entities.reserve(entities_.size());
  for (const auto& e : entities_.entities()) {
    EntitySnapshot es;
    es.id = e.id;
    es.name = e.name;
    es.position = e.position;
    es.radius = e.radius;
    es.healthPercent = e.healthPercent();
    es.state = e.state;
    es.explosionProgress = e.explosionProgress;
    es.respawnProgress = e.respawnProgress;
    f.entities.push_back(std::move(es));
  }

  f.events = events_;
  frame_ = std::move(f);
}

} // namespace starhelm::sim
