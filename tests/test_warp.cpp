#include "starhelm/sim/WarpDrive.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace {

bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

starhelm::sim::WarpDestination makeDest(double z, double radius) {
  starhelm::sim::WarpDestination d;
  d.id = 42;
  d.name = "Beacon";
  d.position = {0.0, 0.0, z};
  d.radius = radius;
  return d;
}

// Applies the warp output the same way the frame loop does.
starhelm::sim::WarpOutput stepWarp(starhelm::sim::WarpDrive& warp,
                                   starhelm::sim::ShipKinematics& ship,
                                   double dt) {
  const auto out = warp.update(dt, ship);
  if (out.orientation) ship.orientation = *out.orientation;
  if (out.position) ship.position = *out.position;
  return out;
}

} // namespace

int test_warp() {
  int fails = 0;

  using namespace starhelm;
  using namespace starhelm::sim;

  // Engage guards.
  {
    WarpDrive warp;
    ShipKinematics ship{};
    std::string err;
    if (warp.engage(ship, &err) || err != "No destination selected.") {
      std::cerr << "[test_warp] expected no-destination rejection, got '" << err << "'\n";
      ++fails;
    }

    warp.setDestination(makeDest(-10.0, 1.0));
    err.clear();
    if (warp.engage(ship, &err) || err.find("Already within arrival distance") != 0) {
      std::cerr << "[test_warp] expected arrival-distance rejection, got '" << err << "'\n";
      ++fails;
    }

    warp.setDestination(makeDest(-1000.0, 5.0));
    if (!warp.engage(ship, &err)) {
      std::cerr << "[test_warp] engage failed: " << err << "\n";
      ++fails;
    }
    err.clear();
    if (warp.engage(ship, &err) || err != "Warp already engaged.") {
      std::cerr << "[test_warp] expected double-engage rejection, got '" << err << "'\n";
      ++fails;
    }
  }

  // Full travel cycle: phases advance one step at a time and the ship stops at
  // the arrival point (radius + buffer short of the centre).
  {
    WarpDrive warp;
    warp.setWarpLevel(3);
    warp.setDestination(makeDest(-1000.0, 5.0));
    ShipKinematics ship{};

    std::string err;
    if (!warp.engage(ship, &err)) {
      std::cerr << "[test_warp] engage failed: " << err << "\n";
      ++fails;
    }
    if (!approx(warp.travel().totalDistance, 970.0, 1e-9)) {
      std::cerr << "[test_warp] totalDistance expected 970, got " << warp.travel().totalDistance << "\n";
      ++fails;
    }

    int transitions = 0;
    bool arrived = false;
    bool badOrder = false;
    bool sawCruise = false;
    for (int i = 0; i < 2000 && !arrived; ++i) {
      const auto out = stepWarp(warp, ship, 0.05);
      if (out.phaseChanged) {
        ++transitions;
        if (out.toPhase != nextWarpPhase(out.fromPhase)) badOrder = true;
      }
      if (warp.phase() == WarpPhase::Cruising) sawCruise = true;
      arrived = out.arrived;
    }

    if (!arrived || !warp.idle()) {
      std::cerr << "[test_warp] expected arrival, phase=" << warpPhaseName(warp.phase()) << "\n";
      ++fails;
    }
    if (badOrder || transitions != 6 || !sawCruise) {
      std::cerr << "[test_warp] phase sequence broken (transitions=" << transitions << ")\n";
      ++fails;
    }
    if (!approx(ship.position.x, 0.0, 1e-6) || !approx(ship.position.z, -970.0, 1e-6)) {
      std::cerr << "[test_warp] expected arrival at z=-970, got " << ship.position << "\n";
      ++fails;
    }
    if (warp.distanceRemaining() != 0.0 || warp.etaSec() != 0.0 || warp.stretch() != 0.0) {
      std::cerr << "[test_warp] telemetry not reset after arrival\n";
      ++fails;
    }
    if (!warp.destination()) {
      std::cerr << "[test_warp] destination selection should survive arrival\n";
      ++fails;
    }
  }

  // Emergency stop mid-cruise leaves the ship where it is.
  {
    WarpDrive warp;
    warp.setWarpLevel(1);
    warp.setDestination(makeDest(-5000.0, 5.0));
    ShipKinematics ship{};

    if (warp.emergencyStop()) {
      std::cerr << "[test_warp] emergency stop should be a no-op while idle\n";
      ++fails;
    }
    if (warp.skipToDestination()) {
      std::cerr << "[test_warp] skip should be rejected while idle\n";
      ++fails;
    }

    (void)warp.engage(ship);
    for (int i = 0; i < 400 && warp.phase() != WarpPhase::Cruising; ++i) stepWarp(warp, ship, 0.05);
    for (int i = 0; i < 10; ++i) stepWarp(warp, ship, 0.05);

    if (warp.phase() != WarpPhase::Cruising) {
      std::cerr << "[test_warp] expected to be cruising, got " << warpPhaseName(warp.phase()) << "\n";
      ++fails;
    }
    if (!(warp.progress() > 0.0 && warp.progress() < 1.0)) {
      std::cerr << "[test_warp] cruise progress out of range: " << warp.progress() << "\n";
      ++fails;
    }
    const double eta = warp.etaSec();
    if (!approx(eta, warp.distanceRemaining() / 38.5, 1e-9)) {
      std::cerr << "[test_warp] eta mismatch: " << eta << "\n";
      ++fails;
    }

    const math::Vec3d stopAt = ship.position;
    if (!warp.emergencyStop() || !warp.idle()) {
      std::cerr << "[test_warp] emergency stop failed\n";
      ++fails;
    }
    const auto out = stepWarp(warp, ship, 0.05);
    if (out.position || out.phaseChanged || ship.position.z != stopAt.z) {
      std::cerr << "[test_warp] ship moved after emergency stop\n";
      ++fails;
    }
  }

  // Skip collapses the cruise.
  {
    WarpDrive warp;
    warp.setWarpLevel(1);
    warp.setDestination(makeDest(-5000.0, 5.0));
    ShipKinematics ship{};
    (void)warp.engage(ship);
    for (int i = 0; i < 400 && warp.phase() != WarpPhase::Cruising; ++i) stepWarp(warp, ship, 0.05);

    if (!warp.skipToDestination()) {
      std::cerr << "[test_warp] skip rejected while cruising\n";
      ++fails;
    }
    const auto out = stepWarp(warp, ship, 0.05);
    if (!out.phaseChanged || out.toPhase != WarpPhase::Decelerating) {
      std::cerr << "[test_warp] expected decelerating after skip\n";
      ++fails;
    }
    if (!approx(ship.position.z, -4970.0, 1e-6)) {
      std::cerr << "[test_warp] skip should jump to the arrival point, got " << ship.position << "\n";
      ++fails;
    }
  }

  // Warp level clamps to [1, 9] and sets cruise speed as level^3 * base.
  {
    WarpDrive warp;
    warp.setWarpLevel(12);
    if (warp.warpLevel() != 9 || !approx(warp.cruiseSpeed(), 729.0 * 38.5)) {
      std::cerr << "[test_warp] warp level clamp (high) failed\n";
      ++fails;
    }
    warp.setWarpLevel(0);
    if (warp.warpLevel() != 1) {
      std::cerr << "[test_warp] warp level clamp (low) failed\n";
      ++fails;
    }
  }

  if (formatEta(75.4) != "01:15" || formatEta(0.0) != "00:00"
      || formatEta(std::numeric_limits<double>::infinity()) != "--:--") {
    std::cerr << "[test_warp] formatEta mismatch\n";
    ++fails;
  }

  if (fails == 0) std::cout << "[test_warp] pass\n";
  return fails;
}
