#include "starhelm/sim/ShipSystems.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool hasTransition(const std::vector<starhelm::sim::SystemEvent>& events, const std::string& key,
                   starhelm::sim::SystemStatus to) {
  for (const auto& e : events) {
    if (e.key == key && e.to == to) return true;
  }
  return false;
}

} // namespace

int test_ship_systems() {
  int fails = 0;

  using namespace starhelm;
  using namespace starhelm::sim;

  // Stock loadout.
  {
    ShipSystems s;
    const char* keys[] = {"warp", "impulse", "shields", "phasers", "torpedoes", "sensors", "lifesupport", "computer"};
    if (s.systems().size() != 8) {
      std::cerr << "[test_ship_systems] expected 8 systems, got " << s.systems().size() << "\n";
      ++fails;
    }
    for (std::size_t i = 0; i < s.systems().size() && i < 8; ++i) {
      const ShipSystem& sys = s.systems()[i];
      if (sys.key != keys[i] || sys.status != SystemStatus::Online || sys.power != 100.0) {
        std::cerr << "[test_ship_systems] loadout mismatch at " << i << " (" << sys.key << ")\n";
        ++fails;
      }
    }
    if (!s.find("warp") || s.find("warp")->name != "Warp Drive" || s.find("transporter")) {
      std::cerr << "[test_ship_systems] find by key failed\n";
      ++fails;
    }
  }

  // Power buckets.
  {
    const ShipSystemsParams p;
    if (classifyPower(0.0, p) != SystemStatus::Offline || classifyPower(49.9, p) != SystemStatus::Damaged
        || classifyPower(50.0, p) != SystemStatus::Online) {
      std::cerr << "[test_ship_systems] classifyPower thresholds\n";
      ++fails;
    }
  }

  // Damage walks a system down to offline, where it stays until repaired.
  {
    ShipSystems s;
    std::string err;
    if (s.damageSystem("bogus", 10.0, &err) || err != "Unknown system 'bogus'.") {
      std::cerr << "[test_ship_systems] unknown key: '" << err << "'\n";
      ++fails;
    }

    s.damageSystem("phasers", 60.0);
    s.damageSystem("phasers", std::nan(""));
    s.damageSystem("phasers", -20.0);
    const ShipSystem* ph = s.find("phasers");
    if (!approx(ph->power, 40.0) || ph->status != SystemStatus::Damaged
        || !hasTransition(s.drainEvents(), "phasers", SystemStatus::Damaged)) {
      std::cerr << "[test_ship_systems] phasers after 60 damage: power=" << ph->power << "\n";
      ++fails;
    }

    s.damageSystem("phasers", 100.0);
    s.update(1.0);
    if (ph->power != 0.0 || ph->status != SystemStatus::Offline) {
      std::cerr << "[test_ship_systems] offline system recharged to " << ph->power << "\n";
      ++fails;
    }
    if (s.toggleSystem("phasers", true, &err) || err != "Phaser Array is offline.") {
      std::cerr << "[test_ship_systems] offline toggle: '" << err << "'\n";
      ++fails;
    }

    s.repairSystem("phasers", 30.0);
    if (!approx(ph->power, 30.0) || ph->status != SystemStatus::Damaged) {
      std::cerr << "[test_ship_systems] partial repair should read damaged\n";
      ++fails;
    }
    s.repairSystem("phasers", 500.0);
    if (ph->power != 100.0 || ph->status != SystemStatus::Online) {
      std::cerr << "[test_ship_systems] full repair should cap at 100 and read online\n";
      ++fails;
    }
  }

  // Charging and drain.
  {
    ShipSystems s;
    s.damageSystem("torpedoes", 55.0);
    s.drainEvents();
    s.update(1.0);
    if (!approx(s.find("torpedoes")->power, 50.0) || !hasTransition(s.drainEvents(), "torpedoes", SystemStatus::Online)) {
      std::cerr << "[test_ship_systems] torpedoes should recharge back to online\n";
      ++fails;
    }

    if (!s.toggleSystem("warp") || !s.find("warp")->active) {
      std::cerr << "[test_ship_systems] toggle did not activate warp\n";
      ++fails;
    }
    s.update(2.0);
    if (!approx(s.find("warp")->power, 90.0)) {
      std::cerr << "[test_ship_systems] active warp power=" << s.find("warp")->power << " expected 90\n";
      ++fails;
    }
    s.toggleSystem("warp", false);
    s.update(1.0);
    if (!approx(s.find("warp")->power, 95.0)) {
      std::cerr << "[test_ship_systems] idle warp power=" << s.find("warp")->power << " expected 95\n";
      ++fails;
    }

    // Always-on systems charge faster than they draw.
    for (int i = 0; i < 100; ++i) s.update(1.0);
    if (s.find("sensors")->power != 100.0 || s.find("lifesupport")->status != SystemStatus::Online) {
      std::cerr << "[test_ship_systems] always-on systems ran down\n";
      ++fails;
    }
  }

  // Hull damage spill.
  {
    ShipSystemsParams p;
    p.hullSpillChance = 1.0;
    ShipSystems s(p);

    if (s.absorbHullDamage(5.0)) {
      std::cerr << "[test_ship_systems] damage at the threshold spilled\n";
      ++fails;
    }
    const ShipSystem* hit = s.absorbHullDamage(20.0);
    if (!hit || !approx(hit->power, 90.0)) {
      std::cerr << "[test_ship_systems] 20 hull damage should cost one system 10 power\n";
      ++fails;
    }

    // Same seed, same sequence; reset restarts it.
    ShipSystems a;
    ShipSystems b;
    std::vector<std::string> first;
    bool same = true;
    int spills = 0;
    for (int i = 0; i < 200; ++i) {
      const ShipSystem* ha = a.absorbHullDamage(6.0);
      const ShipSystem* hb = b.absorbHullDamage(6.0);
      same = same && ((ha == nullptr) == (hb == nullptr)) && (!ha || ha->key == hb->key);
      if (ha) ++spills;
      first.push_back(ha ? ha->key : std::string());
    }
    if (!same || spills == 0 || spills == 200) {
      std::cerr << "[test_ship_systems] spill stream not deterministic or not random, spills=" << spills << "\n";
      ++fails;
    }

    a.reset();
    bool replay = true;
    for (int i = 0; i < 200; ++i) {
      const ShipSystem* ha = a.absorbHullDamage(6.0);
      replay = replay && first[static_cast<std::size_t>(i)] == (ha ? ha->key : std::string());
    }
    if (!replay) {
      std::cerr << "[test_ship_systems] reset did not restart the spill stream\n";
      ++fails;
    }

    a.reset();
    bool pristine = a.drainEvents().empty();
    for (const auto& sys : a.systems()) {
      pristine = pristine && sys.power == 100.0 && sys.status == SystemStatus::Online;
    }
    if (!pristine) {
      std::cerr << "[test_ship_systems] reset left damage behind\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_ship_systems] pass\n";
  return fails;
}
