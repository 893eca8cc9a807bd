#pragma once

#include "starhelm/core/Hash.h"
#include "starhelm/core/Types.h"
#include "starhelm/math/Vec3.h"
#include "starhelm/sim/Destructible.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starhelm::sim {

enum class BodyType : core::u8 {
  Star = 0,
  Planet,
  Dwarf,
  Moon,
  Station,
  Asteroid,
};

const char* bodyTypeName(BodyType t);

struct Destination {
  std::string key;        // stable catalog key ("earth"); hashed into the entity id
  std::string name;
  BodyType type{BodyType::Planet};
  math::Vec3d position{};
  double radius{1.0};
  std::string parentKey;  // empty unless the body orbits another catalog entry
};

// Built-in Sol system, compressed to playable distances.
const std::vector<Destination>& solCatalog();

std::optional<Destination> findDestination(std::string_view key);

inline EntityId entityIdFor(std::string_view key) { return core::fnv1a64(key); }

// Catalog entries sorted nearest first.
std::vector<Destination> destinationsByDistance(const math::Vec3d& from);

} // namespace starhelm::sim
