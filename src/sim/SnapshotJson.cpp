#include "starhelm/sim/SnapshotJson.h"

namespace starhelm::sim {

const char* eventTypeName(EventType t) {
  switch (t) {
    case EventType::WarpPhaseChanged:   return "warp_phase_changed";
    case EventType::WarpArrived:        return "warp_arrived";
    case EventType::WarpEmergencyStop:  return "warp_emergency_stop";
    case EventType::WarpEngageRejected: return "warp_engage_rejected";
    case EventType::TargetChanged:      return "target_changed";
    case EventType::TargetLost:         return "target_lost";
    case EventType::PhasersOverheated:  return "phasers_overheated";
    case EventType::TorpedoFired:       return "torpedo_fired";
    case EventType::TorpedoRejected:    return "torpedo_rejected";
    case EventType::TorpedoImpact:      return "torpedo_impact";
    case EventType::EntityDestroyed:    return "entity_destroyed";
    case EventType::EntityRespawned:    return "entity_respawned";
    case EventType::ShieldCollapsed:    return "shield_collapsed";
    case EventType::HullDamaged:        return "hull_damaged";
    case EventType::DebrisCollision:    return "debris_collision";
    case EventType::ScanComplete:       return "scan_complete";
    case EventType::ScanFailed:         return "scan_failed";
    case EventType::AlertChanged:       return "alert_changed";
    case EventType::SystemDamaged:      return "system_damaged";
    case EventType::SystemStatusChanged: return "system_status_changed";
  }
  return "unknown";
}

void writeVec3Json(core::JsonWriter& j, std::string_view key, const math::Vec3d& v) {
  j.key(key);
  j.beginArray();
  j.value(v.x);
  j.value(v.y);
  j.value(v.z);
  j.endArray();
}

static void writeShip(core::JsonWriter& j, const ShipSnapshot& s) {
  j.key("ship");
  j.beginObject();
  writeVec3Json(j, "position", s.position);
  j.key("orientation");
  j.beginArray();
  j.value(s.orientation.w);
  j.value(s.orientation.x);
  j.value(s.orientation.y);
  j.value(s.orientation.z);
  j.endArray();
  j.field("throttlePercent", s.throttlePercent);
  j.field("targetThrottlePercent", s.targetThrottlePercent);
  j.field("speed", s.speed);
  j.field("warpPhase", warpPhaseName(s.warpPhase));
  j.field("warpLevel", s.warpLevel);
  j.field("warpProgress", s.warpProgress);
  j.field("distanceRemaining", s.distanceRemaining);
  j.field("eta", formatEta(s.etaSec));
  j.field("stretch", s.stretch);
  j.field("destination", s.destinationName);
  j.endObject();
}

static void writeWeapons(core::JsonWriter& j, const WeaponsSnapshot& w) {
  j.key("weapons");
  j.beginObject();
  j.field("online", w.online);
  j.field("phaserHeat", w.phaserHeat);
  j.field("phaserOverheated", w.phaserOverheated);
  j.field("firingPhasers", w.firingPhasers);
  j.field("torpedoAmmo", w.torpedoAmmo);
  j.field("torpedoMaxAmmo", w.torpedoMaxAmmo);
  j.field("torpedoReloading", w.torpedoReloading);
  j.key("target");
  if (w.targetId == kNoEntity) {
    j.nullValue();
  } else {
    j.beginObject();
    j.key("id"); j.value((unsigned long long)w.targetId);
    j.field("name", w.targetName);
    j.field("distance", w.targetDistance);
    j.endObject();
  }
  j.key("projectiles");
  j.beginArray();
  for (const auto& p : w.projectilePositions) {
    j.beginArray();
    j.value(p.x);
    j.value(p.y);
    j.value(p.z);
    j.endArray();
  }
  j.endArray();
  j.endObject();
}

static void writeDefense(core::JsonWriter& j, const DefenseSnapshot& d) {
  j.key("defense");
  j.beginObject();
  j.key("shields");
  j.beginObject();
  for (std::size_t i = 0; i < kShieldQuadrantCount; ++i) {
    j.field(shieldQuadrantName(static_cast<ShieldQuadrant>(i)), d.shields[i]);
  }
  j.endObject();
  j.field("hull", d.hull);
  j.field("alert", alertLevelName(d.alert));
  j.field("combatActive", d.combatActive);
  j.endObject();
}

static void writeScanner(core::JsonWriter& j, const ScannerSnapshot& s) {
  j.key("scanner");
  j.beginObject();
  j.field("status", scanStatusName(s.status));
  j.field("target", s.targetName);
  j.field("progress", s.progress);
  if (!s.error.empty()) j.field("error", s.error);
  j.endObject();
}

static void writeSystems(core::JsonWriter& j, const std::vector<SystemSnapshot>& systems) {
  j.key("systems");
  j.beginArray();
  for (const auto& s : systems) {
    j.beginObject();
    j.field("key", s.key);
    j.field("status", systemStatusName(s.status));
    j.field("power", s.power);
    j.field("active", s.active);
    j.endObject();
  }
  j.endArray();
}

void writeFrameJson(core::JsonWriter& j, const FrameSnapshot& frame, bool includeEntities) {
  j.beginObject();
  j.key("tick"); j.value((unsigned long long)frame.tick);
  j.field("time", frame.timeSec);
  j.field("dt", frame.dtSec);

  writeShip(j, frame.ship);
  writeWeapons(j, frame.weapons);
  writeDefense(j, frame.defense);
  writeScanner(j, frame.scanner);
  writeSystems(j, frame.systems);

  if (includeEntities) {
    j.key("entities");
    j.beginArray();
    for (const auto& e : frame.entities) {
      j.beginObject();
      j.key("id"); j.value((unsigned long long)e.id);
      j.field("name", e.name);
      j.field("health", e.healthPercent);
      j.field("state", damageStateName(e.state));
      j.field("explosionProgress", e.explosionProgress);
      j.field("respawnProgress", e.respawnProgress);
      j.endObject();
    }
    j.endArray();
  }

  j.key("events");
  j.beginArray();
  for (const auto& ev : frame.events) {
    j.beginObject();
    j.field("type", eventTypeName(ev.type));
    if (ev.entity != kNoEntity) {
      j.key("entity"); j.value((unsigned long long)ev.entity);
    }
    if (!ev.detail.empty()) j.field("detail", ev.detail);
    if (ev.value != 0.0) j.field("value", ev.value);
    j.endObject();
  }
  j.endArray();

  j.endObject();
}

} // namespace starhelm::sim
