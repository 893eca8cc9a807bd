#include "starhelm/sim/Simulation.h"
#include "starhelm/sim/SnapshotJson.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

namespace {

bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

starhelm::sim::Destination makeBeacon(double z) {
  starhelm::sim::Destination d;
  d.key = "beacon";
  d.name = "Beacon";
  d.type = starhelm::sim::BodyType::Station;
  d.position = {0.0, 0.0, z};
  d.radius = 5.0;
  return d;
}

const starhelm::sim::SimEvent* findEvent(const starhelm::sim::FrameSnapshot& f, starhelm::sim::EventType t) {
  for (const auto& ev : f.events) {
    if (ev.type == t) return &ev;
  }
  return nullptr;
}

} // namespace

int test_simulation() {
  int fails = 0;

  using namespace starhelm;
  using namespace starhelm::sim;

  const double dt = 1.0 / 60.0;
  const InputSnapshot idle{};

  InputSnapshot engage{};
  engage.engageWarp = true;

  // Warp 3 to a beacon 1000 units out: arrive at the arrival point, weapons back online.
  {
    Simulation sim;
    sim.addEntity(makeBeacon(-1000.0));
    std::string err;
    if (!sim.setDestination("beacon", &err)) {
      std::cerr << "[test_simulation] setDestination failed: " << err << "\n";
      ++fails;
    }
    sim.setWarpLevel(3);

    WarpPhase prev = WarpPhase::Idle;
    bool orderOk = true;
    bool offlineInWarp = true;
    bool arrived = false;

    const FrameSnapshot* f = &sim.tick(dt, engage);
    for (int i = 0; i < 3000 && !arrived; ++i) {
      const WarpPhase now = f->ship.warpPhase;
      if (now != prev && now != nextWarpPhase(prev)) orderOk = false;
      if (now != WarpPhase::Idle && f->weapons.online) offlineInWarp = false;
      prev = now;

      if (f->hasEvent(EventType::WarpArrived)) {
        arrived = true;
        break;
      }
      f = &sim.tick(dt, idle);
    }

    if (!arrived || f->ship.warpPhase != WarpPhase::Idle) {
      std::cerr << "[test_simulation] warp never arrived\n";
      ++fails;
    }
    if (!orderOk) {
      std::cerr << "[test_simulation] warp phases skipped or reversed\n";
      ++fails;
    }
    if (!offlineInWarp || !f->weapons.online) {
      std::cerr << "[test_simulation] weapons online state wrong across warp\n";
      ++fails;
    }
    if (!approx(f->ship.position.x, 0.0, 1e-6) || !approx(f->ship.position.z, -970.0, 1e-6)) {
      std::cerr << "[test_simulation] arrival position " << f->ship.position << "\n";
      ++fails;
    }

    // Parked at normal speed afterwards.
    const math::Vec3d parked = f->ship.position;
    for (int i = 0; i < 10; ++i) sim.tick(dt, idle);
    if (math::distance(parked, sim.snapshot().ship.position) > 1e-9) {
      std::cerr << "[test_simulation] ship drifted after arrival\n";
      ++fails;
    }

    // Inside the arrival distance now: engage is rejected and reported.
    const FrameSnapshot& again = sim.tick(dt, engage);
    if (!again.hasEvent(EventType::WarpEngageRejected) || again.ship.warpPhase != WarpPhase::Idle) {
      std::cerr << "[test_simulation] expected engage rejection at the destination\n";
      ++fails;
    }
  }

  // Emergency stop mid-cruise keeps the interpolated position.
  {
    Simulation sim;
    sim.addEntity(makeBeacon(-5000.0));
    sim.setDestination("beacon");
    sim.setWarpLevel(1);

    sim.tick(dt, engage);
    for (int i = 0; i < 1000 && sim.snapshot().ship.warpPhase != WarpPhase::Cruising; ++i) sim.tick(dt, idle);
    for (int i = 0; i < 30; ++i) sim.tick(dt, idle);

    if (sim.snapshot().ship.warpPhase != WarpPhase::Cruising) {
      std::cerr << "[test_simulation] expected to be cruising before the stop\n";
      ++fails;
    }
    const math::Vec3d before = sim.snapshot().ship.position;

    InputSnapshot stop{};
    stop.emergencyStop = true;
    stop.throttleAxis = 1.0;
    const FrameSnapshot& f = sim.tick(dt, stop);
    if (f.ship.throttlePercent != 0.0 || f.ship.targetThrottlePercent != 0.0) {
      std::cerr << "[test_simulation] throttle spooled on the stop tick\n";
      ++fails;
    }
    if (f.ship.warpPhase != WarpPhase::Idle || !f.hasEvent(EventType::WarpEmergencyStop)) {
      std::cerr << "[test_simulation] emergency stop did not drop to idle\n";
      ++fails;
    }
    if (math::distance(before, f.ship.position) > 1e-9 || f.ship.position.z < -4900.0) {
      std::cerr << "[test_simulation] emergency stop moved the ship to " << f.ship.position << "\n";
      ++fails;
    }
    if (sim.tick(dt, idle).ship.warpPhase != WarpPhase::Idle) {
      std::cerr << "[test_simulation] warp resumed after emergency stop\n";
      ++fails;
    }
  }

  // Phasers through the frame loop: hold to fire, release to stop.
  {
    Simulation sim;
    sim.populateFromCatalog();
    if (!sim.lockTarget("earth")) {
      std::cerr << "[test_simulation] could not lock earth\n";
      ++fails;
    }

    InputSnapshot fire{};
    fire.firePhasers = true;
    for (int i = 0; i < 10; ++i) sim.tick(0.1, fire);
    const DestructibleEntity* earth = sim.entities().find(entityIdFor("earth"));
    if (!sim.snapshot().weapons.firingPhasers || !earth || !approx(earth->health, 90.0, 1e-6)) {
      std::cerr << "[test_simulation] phasers did not deal 10 dps\n";
      ++fails;
    }
    if (!sim.snapshot().defense.combatActive || sim.snapshot().defense.alert != AlertLevel::Yellow) {
      std::cerr << "[test_simulation] firing should raise the combat alert\n";
      ++fails;
    }

    sim.tick(0.1, idle);
    sim.tick(0.1, idle);
    if (sim.snapshot().weapons.firingPhasers || !approx(earth->health, 90.0, 1e-6)) {
      std::cerr << "[test_simulation] phasers kept firing after release\n";
      ++fails;
    }
  }

  // Weapons are inert while the warp drive is active.
  {
    Simulation sim;
    sim.populateFromCatalog();
    sim.setDestination("jupiter");
    sim.lockTarget("earth");
    sim.tick(dt, engage);

    InputSnapshot fire{};
    fire.firePhasers = true;
    fire.fireTorpedo = true;
    const FrameSnapshot& f = sim.tick(dt, fire);
    const SimEvent* rejected = findEvent(f, EventType::TorpedoRejected);
    if (f.weapons.online || f.weapons.firingPhasers || !rejected || rejected->detail != "Weapons offline.") {
      std::cerr << "[test_simulation] weapons fired during warp\n";
      ++fails;
    }
    if (f.weapons.torpedoAmmo != f.weapons.torpedoMaxAmmo) {
      std::cerr << "[test_simulation] torpedo consumed during warp\n";
      ++fails;
    }
  }

  // Destruction spawns debris, drops the lock, and the body comes back later.
  {
    Simulation sim;
    sim.populateFromCatalog();
    const EntityId earthId = entityIdFor("earth");
    sim.lockTarget("earth");
    sim.entities().applyDamage(earthId, 1000.0);

    const FrameSnapshot& f = sim.tick(0.1, idle);
    if (!f.hasEvent(EventType::EntityDestroyed) || !f.hasEvent(EventType::TargetLost) || !sim.debris().hasField(earthId)) {
      std::cerr << "[test_simulation] destruction did not propagate\n";
      ++fails;
    }
    if (f.weapons.targetId != kNoEntity) {
      std::cerr << "[test_simulation] lock survived destruction\n";
      ++fails;
    }

    bool respawned = false;
    bool clearedBeforeRespawn = false;
    for (int i = 0; i < 400; ++i) {
      const FrameSnapshot& g = sim.tick(0.1, idle);
      if (g.hasEvent(EventType::EntityRespawned)) respawned = true;
      if (!respawned && !sim.debris().hasField(earthId)) clearedBeforeRespawn = true;
    }
    const DestructibleEntity* earth = sim.entities().find(earthId);
    if (!respawned || !clearedBeforeRespawn || !earth || earth->state != DamageState::Healthy) {
      std::cerr << "[test_simulation] expected debris cleared then respawn\n";
      ++fails;
    }
  }

  // Scanner via input, close to a body.
  {
    Simulation sim;
    sim.populateFromCatalog();
    sim.flight().reset({200.0, 0.0, -180.0}, math::Quatd::identity());

    InputSnapshot scan{};
    scan.scan = true;
    sim.tick(0.1, scan);
    if (sim.snapshot().scanner.status != ScanStatus::Scanning || sim.snapshot().scanner.targetName != "Earth") {
      std::cerr << "[test_simulation] scan did not start on Earth\n";
      ++fails;
    }

    bool complete = false;
    for (int i = 0; i < 40 && !complete; ++i) {
      complete = sim.tick(0.1, idle).hasEvent(EventType::ScanComplete);
    }
    if (!complete) {
      std::cerr << "[test_simulation] scan never completed\n";
      ++fails;
    }
  }

  // Frame delta is clamped; hazards route through the facing quadrant.
  {
    Simulation sim;
    if (!approx(sim.tick(5.0, idle).dtSec, 0.1) || sim.tick(-1.0, idle).dtSec != 0.0
        || sim.tick(std::nan(""), idle).dtSec != 0.0) {
      std::cerr << "[test_simulation] dt clamp failed\n";
      ++fails;
    }
    if (!approx(sim.timeSec(), 0.1) || sim.tickCount() != 3) {
      std::cerr << "[test_simulation] clock mismatch t=" << sim.timeSec() << "\n";
      ++fails;
    }

    const HitResult r = sim.damageShip(20.0, {0.0, 0.0, -10.0});
    const FrameSnapshot& f = sim.tick(0.1, idle);
    if (!approx(r.absorbed, 20.0) || !approx(f.defense.shields[0], 80.0) || f.defense.shields[1] != 100.0) {
      std::cerr << "[test_simulation] fore hit mismatch\n";
      ++fails;
    }
  }

  // Host-forced combat raises the alert and releasing it lets it fall back.
  {
    Simulation sim;
    sim.setCombatActive(true);
    const FrameSnapshot& f = sim.tick(0.1, idle);
    if (!f.defense.combatActive || f.defense.alert != AlertLevel::Yellow) {
      std::cerr << "[test_simulation] forced combat did not raise the alert\n";
      ++fails;
    }
    sim.setCombatActive(false);
    const FrameSnapshot& g = sim.tick(0.1, idle);
    if (g.defense.combatActive || g.defense.alert != AlertLevel::Green) {
      std::cerr << "[test_simulation] alert stuck after forced combat ended\n";
      ++fails;
    }
  }

  // Ship system power: status changes, hull spill, full reset.
  {
    SimulationParams p;
    p.systems.hullSpillChance = 1.0;
    Simulation sim(p);

    std::string err;
    if (sim.damageSystem("replicator", 10.0, &err) || err.empty()) {
      std::cerr << "[test_simulation] unknown system accepted\n";
      ++fails;
    }
    sim.damageSystem("warp", 60.0);
    const FrameSnapshot& f = sim.tick(0.1, idle);
    const SimEvent* changed = findEvent(f, EventType::SystemStatusChanged);
    if (f.systems.size() != 8 || f.systems[0].key != "warp" || f.systems[0].status != SystemStatus::Damaged
        || !changed || changed->detail != "warp online->damaged") {
      std::cerr << "[test_simulation] warp damage not reported in the frame\n";
      ++fails;
    }

    sim.damageShip(130.0, {0.0, 0.0, -10.0});
    const FrameSnapshot& g = sim.tick(0.1, idle);
    const SimEvent* spill = findEvent(g, EventType::SystemDamaged);
    if (!approx(g.defense.hull, 70.0) || !g.hasEvent(EventType::HullDamaged) || !spill || !approx(spill->value, 15.0)) {
      std::cerr << "[test_simulation] hull breach did not reach a system, hull=" << g.defense.hull << "\n";
      ++fails;
    }

    sim.resetShipSystems();
    const FrameSnapshot& h = sim.tick(0.1, idle);
    bool restored = h.defense.hull == 100.0 && h.defense.alert == AlertLevel::Green && !h.defense.combatActive;
    for (double q : h.defense.shields) restored = restored && q == 100.0;
    for (const auto& sys : h.systems) restored = restored && sys.power == 100.0 && sys.status == SystemStatus::Online;
    if (!restored) {
      std::cerr << "[test_simulation] resetShipSystems left damage behind\n";
      ++fails;
    }
  }

  // JSON frame view.
  {
    Simulation sim;
    sim.populateFromCatalog();
    const FrameSnapshot& f = sim.tick(dt, idle);

    std::ostringstream os;
    core::JsonWriter j(os, false);
    writeFrameJson(j, f, false);
    const std::string s = os.str();
    if (s.find("\"warpPhase\":\"idle\"") == std::string::npos || s.find("\"alert\":\"green\"") == std::string::npos
        || s.find("\"events\":[]") == std::string::npos || s.find("\"systems\":[") == std::string::npos || s.find("\"entities\"") != std::string::npos) {
      std::cerr << "[test_simulation] frame json unexpected: " << s << "\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_simulation] pass\n";
  return fails;
}
