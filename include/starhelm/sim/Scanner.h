#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Destructible.h"

#include <string>

namespace starhelm::sim {

struct ScannerParams {
  double scanDurationSec{3.0};
  double maxRange{100.0};
};

enum class ScanStatus : core::u8 {
  Idle = 0,
  Scanning,
  Complete,
  Failed,
};

const char* scanStatusName(ScanStatus s);

struct ScannerState {
  ScanStatus status{ScanStatus::Idle};
  EntityId targetId{kNoEntity};
  double progress{0.0};   // [0,100]
  std::string error;      // set when the last scan failed
};

// Short-range sensor sweep of a single entity.
class Scanner {
public:
  explicit Scanner(const ScannerParams& params = {});

  void setOnline(bool online) { online_ = online; }
  bool online() const { return online_; }

  // Nearest targetable entity within range.
  bool startScan(const math::Vec3d& shipPosition, const EntityTable& table, std::string* outError = nullptr);
  bool startScan(EntityId id, const math::Vec3d& shipPosition, const EntityTable& table,
                 std::string* outError = nullptr);

  void cancel();

  // Returns true on the tick the scan completes.
  bool update(double dtSeconds, const math::Vec3d& shipPosition, const EntityTable& table);

  const ScannerState& state() const { return state_; }
  const ScannerParams& params() const { return params_; }

private:
  void fail(const std::string& reason);

  ScannerParams params_;
  ScannerState state_{};
  bool online_{true};
};

} // namespace starhelm::sim
