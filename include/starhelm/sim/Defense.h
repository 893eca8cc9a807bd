#pragma once

#include "starhelm/core/Types.h"
#include "starhelm/math/Quat.h"
#include "starhelm/math/Vec3.h"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace starhelm::sim {

enum class ShieldQuadrant : core::u8 {
  Fore = 0,
  Aft,
  Port,
  Starboard,
};

constexpr std::size_t kShieldQuadrantCount = 4;

const char* shieldQuadrantName(ShieldQuadrant q);

enum class AlertLevel : core::u8 {
  Green = 0,
  Yellow,
  Red,
};

const char* alertLevelName(AlertLevel a);

// Shield and hull values are percentages.
struct DefenseParams {
  double shieldRechargePerSec{2.0};
  double shieldRechargeDelaySec{3.0};   // no recharge this long after a hit

  double shieldCriticalPct{25.0};       // below -> red
  double shieldCautionPct{50.0};        // below -> yellow
  double hullRedPct{50.0};
  double hullYellowPct{80.0};
  double alertHysteresisPct{5.0};

  double collisionDamage{5.0};          // one debris / environment packet

  // Combat stays active this long after the last hit or shot.
  double combatWindowSec{5.0};
};

struct ShieldQuadrantState {
  double strength{100.0};
  std::optional<double> lastHitSec;
};

struct DefenseState {
  std::array<ShieldQuadrantState, kShieldQuadrantCount> shields{};
  double hull{100.0};
  AlertLevel alert{AlertLevel::Green};
  bool combatActive{false};

  double shield(ShieldQuadrant q) const { return shields[static_cast<std::size_t>(q)].strength; }
};

struct HitResult {
  double absorbed{0.0};     // taken by shields
  double hullDamage{0.0};   // overflow taken by the hull
  bool shieldCollapsed{false};
};

enum class DefenseEventType : core::u8 {
  ShieldCollapsed,
  HullDamaged,
  AlertChanged,
};

struct DefenseEvent {
  DefenseEventType type{DefenseEventType::HullDamaged};
  ShieldQuadrant quadrant{ShieldQuadrant::Fore};
  double amount{0.0};
  AlertLevel alert{AlertLevel::Green};
};

// Quadrant facing `sourcePos` in the ship's local frame (forward -Z, right +X).
// A source at the ship's own position maps to Fore.
ShieldQuadrant quadrantFor(const math::Quatd& orientation,
                           const math::Vec3d& shipPosition,
                           const math::Vec3d& sourcePosition);

class DefenseSystem {
public:
  explicit DefenseSystem(const DefenseParams& params = {});

  // Quadrant absorbs first; whatever it cannot hold goes to the hull.
  HitResult applyDamage(double amount, ShieldQuadrant quadrant);

  // Split evenly across the four quadrants, each overflowing on its own.
  HitResult applyDamageOmni(double amount);

  // Environmental collision packet through the quadrant facing the impact.
  HitResult applyCollision(const math::Quatd& orientation,
                           const math::Vec3d& shipPosition,
                           const math::Vec3d& impactPosition);

  // Host-driven combat flag (e.g. hostile contact). Independent of the combat window.
  void setCombatActive(bool active) { combatForced_ = active; }
  // Opens the combat window at the current time.
  void noteCombat() { lastCombatSec_ = nowSec_; }

  // Advances the clock, recharges quadrants and derives the alert level.
  void update(double dtSeconds);

  void reset();

  const DefenseState& state() const { return state_; }
  const DefenseParams& params() const { return params_; }
  double nowSec() const { return nowSec_; }

  std::vector<DefenseEvent> drainEvents();

private:
  HitResult absorb(double amount, ShieldQuadrant quadrant);
  AlertLevel deriveAlert() const;
  bool clearsWithMargin() const;

  DefenseParams params_;
  DefenseState state_{};
  double nowSec_{0.0};
  std::optional<double> lastCombatSec_;
  bool combatForced_{false};
  std::vector<DefenseEvent> events_;
};

} // namespace starhelm::sim
