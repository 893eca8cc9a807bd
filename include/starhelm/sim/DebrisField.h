#pragma once

#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Destructible.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace starhelm::sim {

struct DebrisParams {
  int chunksPerField{50};

  // Chunks start between inner and outer multiples of the body radius.
  double innerSpread{1.0};
  double outerSpread{3.0};

  double minDriftSpeed{0.1};
  double maxDriftSpeed{0.4};

  // Chunk radius = scale * bodyRadius * chunkRadiusFactor.
  double minScale{0.5};
  double maxScale{2.0};
  double chunkRadiusFactor{0.08};

  double shipRadius{3.0};
  double collisionCooldownSec{0.5};
};

struct DebrisChunk {
  EntityId source{kNoEntity};
  math::Vec3d position{};
  math::Vec3d velocity{};
  double radius{0.0};
};

// Drifting wreckage left by destroyed entities. Layout is a pure function of
// the entity id, so a replay spawns identical fields.
class DebrisField {
public:
  explicit DebrisField(const DebrisParams& params = {});

  void spawn(EntityId source, const math::Vec3d& center, double bodyRadius);
  void clear(EntityId source);
  void clearAll();

  // Drifts every chunk and tests it against the ship sphere.
  // Returns the chunk struck this tick (at most one per cooldown window).
  std::optional<DebrisChunk> update(double dtSeconds, const math::Vec3d& shipPosition);

  const std::vector<DebrisChunk>& chunks() const { return chunks_; }
  bool hasField(EntityId source) const;
  std::size_t fieldCount() const;

private:
  DebrisParams params_;
  std::vector<DebrisChunk> chunks_;
  double nowSec_{0.0};
  std::optional<double> lastCollisionSec_;
};

} // namespace starhelm::sim
