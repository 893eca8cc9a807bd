#include "starhelm/core/Args.h"
#include "starhelm/core/JsonWriter.h"
#include "starhelm/core/Log.h"
#include "starhelm/sim/Destinations.h"
#include "starhelm/sim/Simulation.h"
#include "starhelm/sim/SnapshotJson.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace starhelm;

static void printHelp() {
  std::cout << "starhelm_sandbox\n"
            << "  --dest <key>           Warp destination catalog key (default: earth)\n"
            << "  --warp <1-9>           Warp level (default: 3)\n"
            << "  --pos <x y z>          Starting position (default: 0 0 0)\n"
            << "  --dt <sec>             Fixed tick length (default: 0.0166667)\n"
            << "  --duration <sec>       Simulated time (default: 20)\n"
            << "  --throttle <axis>      Held throttle axis in [-1,1] (default: 0)\n"
            << "  --json                 Emit machine-readable JSON to stdout (also works with --out)\n"
            << "  --out <path>           Write JSON output to a file instead of stdout\n"
            << "  --every <n>            JSON: also emit every n-th frame (default: 0, event frames only)\n"
            << "  --entities             JSON: include the entity table in each frame\n"
            << "  --log <level>          trace|debug|info|warn|error|off (default: info)\n"
            << "  --list                 Print the destination catalog and exit\n"
            << "\n"
            << "Scripted timeline (repeatable):\n"
            << "  --at <sec> <action>    engage | stop | skip | fullstop | cycle | phasers | cease |\n"
            << "                         torpedo | scan | dest=<key> | lock=<key> | warp=<n> | hit=<amount> |\n"
            << "                         combat=on|off | reset | sysdmg=<key>:<amount> | repair=<key>:<amount> |\n"
            << "                         toggle=<key>\n"
            << "\n"
            << "Parameter overrides:\n"
            << "  --baseSpeed <u/s>      Warp 1 speed (default: 38.5)\n"
            << "  --maxImpulse <u/s>     Impulse speed at 100% throttle (default: 15)\n"
            << "  --chargeTime <sec>     Warp charge time (default: 2.5)\n"
            << "  --phaserDps <hp/s>     Phaser damage per second (default: 10)\n"
            << "  --torpedoAmmo <n>      Starting torpedo count (default: 100)\n"
            << "  --torpedoDamage <hp>   Torpedo impact damage (default: 25)\n"
            << "  --respawnFade <sec>    Respawn fade duration (default: 2)\n";
}

namespace {

struct ScriptStep {
  double atSec{0.0};
  std::string action;
  bool done{false};
};

std::vector<ScriptStep> parseScript(const core::Args& args, std::string* outError) {
  std::vector<ScriptStep> steps;
  const auto raw = args.values("at");
  if (raw.size() % 2 != 0) {
    if (outError) *outError = "--at expects <sec> <action> pairs";
    return {};
  }
  for (std::size_t i = 0; i + 1 < raw.size(); i += 2) {
    char* end = nullptr;
    const double t = std::strtod(raw[i].c_str(), &end);
    if (end == raw[i].c_str() || !std::isfinite(t)) {
      if (outError) *outError = "bad --at time: " + raw[i];
      return {};
    }
    steps.push_back(ScriptStep{t, raw[i + 1], false});
  }
  std::stable_sort(steps.begin(), steps.end(),
                   [](const ScriptStep& a, const ScriptStep& b) { return a.atSec < b.atSec; });
  return steps;
}

bool startsWith(const std::string& s, const char* prefix) {
  const std::size_t n = std::char_traits<char>::length(prefix);
  return s.size() >= n && s.compare(0, n, prefix) == 0;
}

// Applies one scripted action. One-shot intents are raised on `pulse` for a single tick.
bool applyAction(sim::Simulation& s, const std::string& action, sim::InputSnapshot& pulse,
                 bool& phasersHeld, std::string* outError) {
  if (action == "engage") { pulse.engageWarp = true; return true; }
  if (action == "stop") { pulse.emergencyStop = true; return true; }
  if (action == "skip") { pulse.skipToDestination = true; return true; }
  if (action == "fullstop") { pulse.fullStop = true; return true; }
  if (action == "cycle") { pulse.cycleTarget = true; return true; }
  if (action == "torpedo") { pulse.fireTorpedo = true; return true; }
  if (action == "scan") { pulse.scan = true; return true; }
  if (action == "phasers") { phasersHeld = true; return true; }
  if (action == "cease") { phasersHeld = false; return true; }

  if (startsWith(action, "dest=")) {
    return s.setDestination(action.substr(5), outError);
  }
  if (startsWith(action, "lock=")) {
    if (!s.lockTarget(action.substr(5))) {
      if (outError) *outError = "cannot lock " + action.substr(5);
      return false;
    }
    return true;
  }
  if (startsWith(action, "warp=")) {
    s.setWarpLevel(std::atoi(action.substr(5).c_str()));
    return true;
  }
  if (startsWith(action, "hit=")) {
    // Directed hit from dead ahead.
    const auto& ship = s.flight().state();
    s.damageShip(std::atof(action.substr(4).c_str()), ship.position + ship.forward() * 10.0);
    return true;
  }

  if (action == "combat=on" || action == "combat=off") {
    s.setCombatActive(action == "combat=on");
    return true;
  }
  if (action == "reset") {
    s.resetShipSystems();
    return true;
  }
  if (startsWith(action, "toggle=")) {
    return s.toggleSystem(action.substr(7), std::nullopt, outError);
  }
  if (startsWith(action, "sysdmg=") || startsWith(action, "repair=")) {
    const std::string body = action.substr(7);
    const std::size_t colon = body.find(':');
    if (colon == std::string::npos) {
      if (outError) *outError = "expected <key>:<amount> in '" + action + "'";
      return false;
    }
    const std::string key = body.substr(0, colon);
    const double amount = std::atof(body.substr(colon + 1).c_str());
    return startsWith(action, "sysdmg=") ? s.damageSystem(key, amount, outError)
                                         : s.repairSystem(key, amount, outError);
  }

  if (outError) *outError = "unknown action '" + action + "'";
  return false;
}

void printFrameLine(const sim::FrameSnapshot& f) {
  for (const auto& ev : f.events) {
    std::cout << "[t=" << std::fixed << std::setprecision(2) << std::setw(7) << f.timeSec << "] "
              << sim::eventTypeName(ev.type);
    if (!ev.detail.empty()) std::cout << " " << ev.detail;
    if (ev.value != 0.0) std::cout << " (" << std::setprecision(1) << ev.value << ")";
    std::cout << "\n";
  }
}

void printSummary(const sim::Simulation& s) {
  const auto& f = s.snapshot();
  std::cout << "\n--- Final state @ t=" << std::fixed << std::setprecision(2) << f.timeSec << " s ---\n";
  std::cout << "Ship pos=" << f.ship.position
            << " throttle=" << std::setprecision(1) << f.ship.throttlePercent << "%"
            << " speed=" << f.ship.speed << "\n";
  std::cout << "Warp " << f.ship.warpLevel << " phase=" << sim::warpPhaseName(f.ship.warpPhase)
            << " progress=" << std::setprecision(3) << f.ship.warpProgress
            << " eta=" << sim::formatEta(f.ship.etaSec) << "\n";
  std::cout << "Weapons heat=" << std::setprecision(1) << f.weapons.phaserHeat
            << (f.weapons.phaserOverheated ? " (overheated)" : "")
            << " torpedoes=" << f.weapons.torpedoAmmo << "/" << f.weapons.torpedoMaxAmmo
            << " target=" << (f.weapons.targetName.empty() ? "-" : f.weapons.targetName) << "\n";
  std::cout << "Shields";
  for (std::size_t i = 0; i < sim::kShieldQuadrantCount; ++i) {
    std::cout << " " << sim::shieldQuadrantName(static_cast<sim::ShieldQuadrant>(i)) << "="
              << f.defense.shields[i];
  }
  std::cout << " hull=" << f.defense.hull << " alert=" << sim::alertLevelName(f.defense.alert) << "\n";
  std::cout << "Systems";
  for (const auto& sys : f.systems) {
    std::cout << " " << sys.key << "=" << std::setprecision(0) << sys.power;
    if (sys.status != sim::SystemStatus::Online) std::cout << "(" << sim::systemStatusName(sys.status) << ")";
  }
  std::cout << "\n";

  for (const auto& e : f.entities) {
    if (e.state == sim::DamageState::Healthy && e.healthPercent >= 100.0) continue;
    std::cout << "  " << std::setw(12) << e.name << " health=" << std::setprecision(1) << e.healthPercent
              << "% state=" << sim::damageStateName(e.state) << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  args.setArity("pos", 3);
  args.setArity("at", 2);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  {
    std::string err;
    if (!args.checkKnown({"help", "h", "dest", "warp", "pos", "dt", "duration", "throttle", "json", "out",
                          "every", "entities", "log", "list", "at", "baseSpeed", "maxImpulse",
                          "chargeTime", "phaserDps", "torpedoAmmo", "torpedoDamage", "respawnFade"},
                         &err)) {
      std::cerr << err << " (see --help)\n";
      return 2;
    }
  }

  {
    std::string levelText;
    if (args.getString("log", levelText)) {
      core::LogLevel level = core::LogLevel::Info;
      if (!core::parseLogLevel(levelText, level)) {
        std::cerr << "Unknown log level: " << levelText << "\n";
        return 2;
      }
      core::setLogLevel(level);
    }
  }

  if (args.hasFlag("list")) {
    for (const auto& d : sim::solCatalog()) {
      std::cout << std::setw(12) << d.key
                << "  " << std::setw(12) << d.name
                << "  " << std::setw(8) << sim::bodyTypeName(d.type)
                << "  pos=" << d.position
                << "  r=" << d.radius
                << "  dist=" << std::fixed << std::setprecision(1) << d.position.length()
                << "\n";
    }
    return 0;
  }

  sim::SimulationParams params;
  (void)args.getDouble("baseSpeed", params.warp.baseSpeed);
  (void)args.getDouble("maxImpulse", params.flight.maxImpulseSpeed);
  (void)args.getDouble("chargeTime", params.warp.chargeTimeSec);
  (void)args.getDouble("phaserDps", params.weapons.phaserDps);
  (void)args.getInt("torpedoAmmo", params.weapons.torpedoInitialAmmo);
  (void)args.getDouble("torpedoDamage", params.weapons.torpedoDamage);
  (void)args.getDouble("respawnFade", params.destructible.respawnFadeSec);
  params.weapons.torpedoMaxAmmo = std::max(params.weapons.torpedoMaxAmmo, params.weapons.torpedoInitialAmmo);

  std::string destKey = "earth";
  (void)args.getString("dest", destKey);

  int warpLevel = 3;
  (void)args.getInt("warp", warpLevel);

  math::Vec3d startPos{0, 0, 0};
  {
    std::vector<double> p;
    if (args.has("pos")) {
      if (!args.getDoubles("pos", p) || p.size() < 3) {
        std::cerr << "--pos expects three numbers\n";
        return 2;
      }
      startPos = {p[p.size() - 3], p[p.size() - 2], p[p.size() - 1]};
    }
  }

  double dt = 1.0 / 60.0;
  (void)args.getDouble("dt", dt);
  double duration = 20.0;
  (void)args.getDouble("duration", duration);
  double throttle = 0.0;
  (void)args.getDouble("throttle", throttle);

  const bool json = args.hasFlag("json");
  const bool withEntities = args.hasFlag("entities");
  std::string outPath;
  (void)args.getString("out", outPath);
  int every = 0;
  (void)args.getInt("every", every);

  std::string scriptErr;
  std::vector<ScriptStep> script = parseScript(args, &scriptErr);
  if (!scriptErr.empty()) {
    std::cerr << scriptErr << "\n";
    return 2;
  }
  if (script.empty()) {
    // Default run: warp out, then try the tactical systems on arrival.
    script = {
      {0.5, "engage", false},
      {12.0, "cycle", false},
      {12.5, "phasers", false},
      {14.0, "torpedo", false},
      {16.0, "cease", false},
    };
  }

  // JSON goes to stdout; keep log lines out of it.
  std::unique_ptr<std::ofstream> jsonFile;
  std::ostream* jsonStream = &std::cout;
  if (json) {
    core::setLogStream(&std::cerr);
    if (!outPath.empty()) {
      jsonFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
      if (!*jsonFile) {
        std::cerr << "Failed to open --out file: " << outPath << "\n";
        return 1;
      }
      jsonStream = jsonFile.get();
    }
  }

  sim::Simulation s(params);
  s.populateFromCatalog();
  s.flight().reset(startPos, math::Quatd::identity());
  s.setWarpLevel(warpLevel);
  {
    std::string err;
    if (!s.setDestination(destKey, &err)) {
      std::cerr << err << "\n";
      return 1;
    }
  }

  core::JsonWriter j(*jsonStream, /*pretty=*/true);
  if (json) {
    j.beginObject();
    j.key("config");
    j.beginObject();
    j.field("destination", destKey);
    j.field("warpLevel", s.warp().warpLevel());
    sim::writeVec3Json(j, "start", startPos);
    j.field("dt", dt);
    j.field("duration", duration);
    j.key("script");
    j.beginArray();
    for (const auto& step : script) {
      j.beginObject();
      j.field("at", step.atSec);
      j.field("action", step.action);
      j.endObject();
    }
    j.endArray();
    j.endObject();
    j.key("frames");
    j.beginArray();
  } else {
    std::cout << "Destination: " << destKey << "  warp " << s.warp().warpLevel()
              << "  dt=" << dt << "  duration=" << duration << " s\n\n";
  }

  bool phasersHeld = false;
  const auto ticks = static_cast<long long>(std::ceil(std::max(0.0, duration) / std::max(1e-6, dt)));

  for (long long t = 0; t < ticks; ++t) {
    sim::InputSnapshot input;
    input.throttleAxis = throttle;

    for (auto& step : script) {
      if (step.done || step.atSec > s.timeSec() + 1e-9) continue;
      step.done = true;
      std::string err;
      if (!applyAction(s, step.action, input, phasersHeld, &err)) {
        STARHELM_LOG_WARN("Script step at " + std::to_string(step.atSec) + "s failed: " + err);
      }
    }
    input.firePhasers = phasersHeld;

    const sim::FrameSnapshot& f = s.tick(dt, input);

    if (json) {
      const bool periodic = every > 0 && (f.tick % (core::u64)every) == 0;
      if (!f.events.empty() || periodic) sim::writeFrameJson(j, f, withEntities);
    } else {
      printFrameLine(f);
    }
  }

  if (json) {
    j.endArray();
    j.key("final");
    sim::writeFrameJson(j, s.snapshot(), true);
    j.endObject();
  } else {
    printSummary(s);
  }

  return 0;
}
