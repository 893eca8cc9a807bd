#include "starhelm/sim/DebrisField.h"

#include "starhelm/core/Log.h"
#include "starhelm/core/Random.h"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace starhelm::sim {

DebrisField::DebrisField(const DebrisParams& params) : params_(params) {}

void DebrisField::spawn(EntityId source, const math::Vec3d& center, double bodyRadius) {
  clear(source);

  const double r0 = std::max(0.0, bodyRadius);
  core::SplitMix64 rng(core::deriveSeed(source, "debris"));

  const int count = std::max(0, params_.chunksPerField);
  chunks_.reserve(chunks_.size() + static_cast<std::size_t>(count));

  for (int i = 0; i < count; ++i) {
    const math::Vec3d dir = rng.unitVector();
    const double dist = r0 * rng.uniform(params_.innerSpread, params_.outerSpread);
    const double drift = rng.uniform(params_.minDriftSpeed, params_.maxDriftSpeed);
    const double scale = rng.uniform(params_.minScale, params_.maxScale);

    DebrisChunk c;
    c.source = source;
    c.position = center + dir * dist;
    c.velocity = dir * drift;
    c.radius = scale * r0 * params_.chunkRadiusFactor;
    chunks_.push_back(c);
  }

  STARHELM_LOG_DEBUG("Debris field spawned: " + std::to_string(count) + " chunks");
}

void DebrisField::clear(EntityId source) {
  chunks_.erase(std::remove_if(chunks_.begin(), chunks_.end(),
                               [source](const DebrisChunk& c) { return c.source == source; }),
                chunks_.end());
}

void DebrisField::clearAll() {
  chunks_.clear();
  lastCollisionSec_.reset();
}

bool DebrisField::hasField(EntityId source) const {
  return std::any_of(chunks_.begin(), chunks_.end(),
                     [source](const DebrisChunk& c) { return c.source == source; });
}

std::size_t DebrisField::fieldCount() const {
  std::unordered_set<EntityId> sources;
  for (const auto& c : chunks_) sources.insert(c.source);
  return sources.size();
}

std::optional<DebrisChunk> DebrisField::update(double dtSeconds, const math::Vec3d& shipPosition) {
  const double dt = std::max(0.0, dtSeconds);
  nowSec_ += dt;

  for (auto& c : chunks_) {
    c.position += c.velocity * dt;
  }

  if (lastCollisionSec_ && (nowSec_ - *lastCollisionSec_) < params_.collisionCooldownSec) {
    return std::nullopt;
  }

  for (const auto& c : chunks_) {
    const double reach = params_.shipRadius + c.radius;
    if ((c.position - shipPosition).lengthSquared() < reach * reach) {
      lastCollisionSec_ = nowSec_;
      return c;
    }
  }
  return std::nullopt;
}

} // namespace starhelm::sim
