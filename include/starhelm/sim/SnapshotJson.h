#pragma once

#include "starhelm/core/JsonWriter.h"
#include "starhelm/sim/Snapshot.h"

#include <string_view>

namespace starhelm::sim {

void writeVec3Json(core::JsonWriter& j, std::string_view key, const math::Vec3d& v);

// Full frame as one JSON object. Entities can be left out for compact traces.
void writeFrameJson(core::JsonWriter& j, const FrameSnapshot& frame, bool includeEntities = true);

} // namespace starhelm::sim
