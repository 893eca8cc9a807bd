#include "starhelm/sim/Scanner.h"

#include "starhelm/core/Log.h"
#include "starhelm/math/Math.h"

#include <algorithm>
#include <limits>

namespace starhelm::sim {

const char* scanStatusName(ScanStatus s) {
  switch (s) {
    case ScanStatus::Idle:     return "idle";
    case ScanStatus::Scanning: return "scanning";
    case ScanStatus::Complete: return "complete";
    case ScanStatus::Failed:   return "failed";
  }
  return "unknown";
}

Scanner::Scanner(const ScannerParams& params) : params_(params) {}

bool Scanner::startScan(const math::Vec3d& shipPosition, const EntityTable& table, std::string* outError) {
  if (!online_) {
    if (outError) *outError = "Sensors unavailable at warp.";
    return false;
  }

  const DestructibleEntity* best = nullptr;
  double bestDist = std::numeric_limits<double>::infinity();

  for (const auto& e : table.entities()) {
    if (!e.targetable()) continue;
    const double d = math::distance(shipPosition, e.position);
    if (d <= params_.maxRange && d < bestDist) {
      best = &e;
      bestDist = d;
    }
  }

  if (!best) {
    if (outError) *outError = "Nothing within scanner range.";
    return false;
  }
  return startScan(best->id, shipPosition, table, outError);
}

bool Scanner::startScan(EntityId id, const math::Vec3d& shipPosition, const EntityTable& table,
                        std::string* outError) {
  if (!online_) {
    if (outError) *outError = "Sensors unavailable at warp.";
    return false;
  }

  const DestructibleEntity* e = table.find(id);
  if (!e || !e->targetable()) {
    if (outError) *outError = "No scannable target.";
    return false;
  }
  if (math::distance(shipPosition, e->position) > params_.maxRange) {
    if (outError) *outError = "Target out of range.";
    return false;
  }

  state_ = ScannerState{};
  state_.status = ScanStatus::Scanning;
  state_.targetId = id;

  STARHELM_LOG_DEBUG("Scanning " + e->name);
  return true;
}

void Scanner::cancel() {
  if (state_.status != ScanStatus::Scanning) return;
  state_.status = ScanStatus::Idle;
  state_.progress = 0.0;
}

void Scanner::fail(const std::string& reason) {
  state_.status = ScanStatus::Failed;
  state_.error = reason;
  STARHELM_LOG_DEBUG("Scan failed: " + reason);
}

bool Scanner::update(double dtSeconds, const math::Vec3d& shipPosition, const EntityTable& table) {
  if (state_.status != ScanStatus::Scanning) return false;

  const DestructibleEntity* e = table.find(state_.targetId);
  if (!e || !e->targetable()) {
    fail("Target signal lost.");
    return false;
  }
  if (math::distance(shipPosition, e->position) > params_.maxRange) {
    fail("Target signal lost - out of range.");
    return false;
  }

  const double dt = std::max(0.0, dtSeconds);
  const double duration = std::max(1e-6, params_.scanDurationSec);
  state_.progress = std::min(100.0, state_.progress + (dt / duration) * 100.0);

  if (state_.progress >= 100.0) {
    state_.status = ScanStatus::Complete;
    STARHELM_LOG_DEBUG("Scan complete: " + e->name);
    return true;
  }
  return false;
}

} // namespace starhelm::sim
