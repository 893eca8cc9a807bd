#include "starhelm/sim/Weapons.h"

#include <cmath>
#include <iostream>
#include <string>

namespace {

bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool hasEvent(const std::vector<starhelm::sim::WeaponEvent>& events, starhelm::sim::WeaponEventType t) {
  for (const auto& e : events) {
    if (e.type == t) return true;
  }
  return false;
}

} // namespace

int test_weapons() {
  int fails = 0;

  using namespace starhelm;
  using namespace starhelm::sim;

  const math::Vec3d origin{};

  auto makeTable = []() {
    EntityTable t;
    t.add(1, "Near", {0.0, 0.0, -50.0}, 2.0);
    t.add(2, "Mid", {0.0, 0.0, -100.0}, 2.0);
    t.add(3, "Far", {0.0, 0.0, -5000.0}, 2.0);
    return t;
  };

  // Cycling walks in-range targets nearest first and wraps.
  {
    EntityTable table = makeTable();
    WeaponsSystem w;

    const EntityId expected[] = {1, 2, 1};
    for (EntityId id : expected) {
      if (!w.cycleTarget(origin, table) || !w.state().lock || w.state().lock->id != id) {
        std::cerr << "[test_weapons] cycle expected id " << (unsigned long long)id << "\n";
        ++fails;
      }
    }
    if (!hasEvent(w.drainEvents(), WeaponEventType::TargetChanged)) {
      std::cerr << "[test_weapons] expected TargetChanged events\n";
      ++fails;
    }

    if (w.lockTarget(3, origin, table)) {
      std::cerr << "[test_weapons] locked a target beyond range\n";
      ++fails;
    }

    EntityTable empty;
    WeaponsSystem w2;
    if (w2.cycleTarget(origin, empty) || w2.state().lock) {
      std::cerr << "[test_weapons] cycle with nothing in range should change nothing\n";
      ++fails;
    }
  }

  // Offline weapons refuse everything.
  {
    EntityTable table = makeTable();
    WeaponsSystem w;
    w.setOnline(false);
    std::string err;
    if (w.cycleTarget(origin, table) || w.firePhasers() || w.fireTorpedo(origin, &err) || err != "Weapons offline.") {
      std::cerr << "[test_weapons] offline weapons accepted a command (err='" << err << "')\n";
      ++fails;
    }
  }

  // Phasers: damage and heat while held, idempotent stop, overheat and recovery.
  {
    EntityTable table = makeTable();
    WeaponsSystem w;
    if (w.firePhasers()) {
      std::cerr << "[test_weapons] phasers fired without a lock\n";
      ++fails;
    }

    w.lockTarget(1, origin, table);
    if (!w.firePhasers()) {
      std::cerr << "[test_weapons] phasers refused with a lock\n";
      ++fails;
    }
    for (int i = 0; i < 10; ++i) w.update(0.1, origin, table);

    if (!approx(table.find(1)->health, 90.0, 1e-6) || !approx(w.state().phaserHeat, 25.0, 1e-6)) {
      std::cerr << "[test_weapons] 1s of phasers: health=" << table.find(1)->health
                << " heat=" << w.state().phaserHeat << "\n";
      ++fails;
    }

    w.stopPhasers();
    w.stopPhasers();
    w.update(0.1, origin, table);
    if (w.state().firingPhasers || !approx(table.find(1)->health, 90.0, 1e-6)) {
      std::cerr << "[test_weapons] stopPhasers did not stop the beam\n";
      ++fails;
    }

    w.firePhasers();
    for (int i = 0; i < 40 && !w.state().phaserOverheated; ++i) w.update(0.1, origin, table);
    if (!w.state().phaserOverheated || w.state().firingPhasers || w.state().phaserHeat != 100.0) {
      std::cerr << "[test_weapons] expected overheat at 100\n";
      ++fails;
    }
    if (!hasEvent(w.drainEvents(), WeaponEventType::PhasersOverheated)) {
      std::cerr << "[test_weapons] missing PhasersOverheated event\n";
      ++fails;
    }
    if (w.firePhasers()) {
      std::cerr << "[test_weapons] phasers fired while overheated\n";
      ++fails;
    }

    for (int i = 0; i < 60; ++i) w.update(0.1, origin, table);
    if (w.state().phaserOverheated || !(w.state().phaserHeat < w.params().phaserRestartHeat)) {
      std::cerr << "[test_weapons] overheat did not clear after cooling, heat=" << w.state().phaserHeat << "\n";
      ++fails;
    }
  }

  // 10-point hits with phaser bursts in between: the state always matches the
  // health bucket and only reads exploding once health is 0.
  {
    EntityTable table;
    table.add(1, "Hulk", {0.0, 0.0, -50.0}, 2.0);
    WeaponsSystem w;
    w.lockTarget(1, origin, table);
    const DestructibleEntity* e = table.find(1);

    bool sawDamaged = false;
    bool sawCritical = false;
    bool consistent = true;
    auto check = [&]() {
      if (e->health > 0.0) {
        consistent = consistent && e->state == classifyHealth(e->health, e->maxHealth, table.params());
      } else {
        consistent = consistent && e->state == DamageState::Exploding;
      }
      sawDamaged = sawDamaged || e->state == DamageState::Damaged;
      sawCritical = sawCritical || e->state == DamageState::Critical;
    };

    for (int round = 0; round < 12 && e->health > 0.0; ++round) {
      table.applyDamage(1, 10.0);
      check();
      w.firePhasers();
      for (int i = 0; i < 5; ++i) {
        w.update(0.1, origin, table);
        check();
      }
      w.stopPhasers();
      for (int i = 0; i < 10; ++i) w.update(0.1, origin, table);
    }

    if (!consistent || !sawDamaged || !sawCritical || e->state != DamageState::Exploding || e->health != 0.0) {
      std::cerr << "[test_weapons] mixed damage sequence broke the health buckets, final state="
                << damageStateName(e->state) << "\n";
      ++fails;
    }
  }

  // Torpedo reload gating with a single round in the magazine.
  {
    EntityTable table = makeTable();
    WeaponParams p;
    p.torpedoMaxAmmo = 1;
    p.torpedoInitialAmmo = 1;
    WeaponsSystem w(p);

    std::string err;
    if (w.fireTorpedo(origin, &err) || err != "No target locked.") {
      std::cerr << "[test_weapons] torpedo without lock: '" << err << "'\n";
      ++fails;
    }

    w.lockTarget(2, origin, table);
    if (!w.fireTorpedo(origin, &err) || w.state().torpedoAmmo != 0) {
      std::cerr << "[test_weapons] first torpedo failed: " << err << "\n";
      ++fails;
    }
    if (w.fireTorpedo(origin, &err)) {
      std::cerr << "[test_weapons] second immediate torpedo accepted\n";
      ++fails;
    }

    for (int i = 0; i < 10; ++i) w.update(0.1, origin, table);
    if (w.fireTorpedo(origin, &err) || !w.state().torpedoReloading()) {
      std::cerr << "[test_weapons] torpedo accepted mid-reload\n";
      ++fails;
    }

    for (int i = 0; i < 30 && w.state().torpedoReloading(); ++i) w.update(0.1, origin, table);
    if (w.state().torpedoAmmo != 1) {
      std::cerr << "[test_weapons] reload should restore ammo to 1, got " << w.state().torpedoAmmo << "\n";
      ++fails;
    }
    if (!w.fireTorpedo(origin, &err)) {
      std::cerr << "[test_weapons] torpedo rejected after reload: " << err << "\n";
      ++fails;
    }
  }

  // Torpedo flight and impact.
  {
    EntityTable table = makeTable();
    WeaponsSystem w;
    w.lockTarget(1, origin, table);
    w.fireTorpedo(origin);
    w.drainEvents();

    bool impact = false;
    double dealt = 0.0;
    for (int i = 0; i < 20 && !impact; ++i) {
      w.update(0.1, origin, table);
      for (const auto& ev : w.drainEvents()) {
        if (ev.type == WeaponEventType::TorpedoImpact) {
          impact = true;
          dealt = ev.damage;
        }
      }
    }
    if (!impact || !approx(dealt, 25.0) || !approx(table.find(1)->health, 75.0) || !w.state().projectiles.empty()) {
      std::cerr << "[test_weapons] torpedo impact mismatch dealt=" << dealt << "\n";
      ++fails;
    }
  }

  // Destroying the locked target drops the lock, the beam and any torpedo in flight.
  {
    EntityTable table = makeTable();
    WeaponsSystem w;
    w.lockTarget(2, origin, table);
    w.fireTorpedo(origin);
    w.firePhasers();
    w.update(0.1, origin, table);
    w.drainEvents();

    table.applyDamage(2, 1000.0);
    w.update(0.1, origin, table);
    const auto events = w.drainEvents();

    if (w.state().lock || w.state().firingPhasers || !w.state().projectiles.empty()) {
      std::cerr << "[test_weapons] lock / beam / projectile survived target destruction\n";
      ++fails;
    }
    if (!hasEvent(events, WeaponEventType::TargetLost) || !hasEvent(events, WeaponEventType::TorpedoLost)) {
      std::cerr << "[test_weapons] expected TargetLost and TorpedoLost events\n";
      ++fails;
    }
    if (w.cycleTarget(origin, table) && w.state().lock->id == 2) {
      std::cerr << "[test_weapons] cycled onto a destroyed entity\n";
      ++fails;
    }
  }

  // A killing beam or impact drops the lock in the same update.
  {
    EntityTable table;
    table.add(1, "Wreck", {0.0, 0.0, -50.0}, 2.0);
    table.applyDamage(1, 99.5);

    WeaponsSystem w;
    w.lockTarget(1, origin, table);
    w.drainEvents();
    w.firePhasers();
    w.update(0.1, origin, table);
    const auto events = w.drainEvents();

    if (table.find(1)->state != DamageState::Exploding) {
      std::cerr << "[test_weapons] finishing beam did not destroy the target\n";
      ++fails;
    }
    if (w.state().lock || w.state().firingPhasers || !hasEvent(events, WeaponEventType::TargetLost)) {
      std::cerr << "[test_weapons] lock or beam outlived the kill by a tick\n";
      ++fails;
    }

    EntityTable table2;
    table2.add(2, "Drone", {0.0, 0.0, -10.0}, 1.0);
    table2.applyDamage(2, 80.0);
    WeaponsSystem w2;
    w2.lockTarget(2, origin, table2);
    w2.fireTorpedo(origin);
    w2.drainEvents();

    bool impact = false;
    bool lostWithImpact = false;
    for (int i = 0; i < 10 && !impact; ++i) {
      w2.update(0.1, origin, table2);
      const auto evs = w2.drainEvents();
      impact = hasEvent(evs, WeaponEventType::TorpedoImpact);
      lostWithImpact = impact && hasEvent(evs, WeaponEventType::TargetLost);
    }
    if (!impact || !lostWithImpact || w2.state().lock) {
      std::cerr << "[test_weapons] torpedo kill should drop the lock with the impact\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_weapons] pass\n";
  return fails;
}
