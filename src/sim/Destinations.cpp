#include "starhelm/sim/Destinations.h"

#include <algorithm>

namespace starhelm::sim {

const char* bodyTypeName(BodyType t) {
  switch (t) {
    case BodyType::Star:     return "star";
    case BodyType::Planet:   return "planet";
    case BodyType::Dwarf:    return "dwarf";
    case BodyType::Moon:     return "moon";
    case BodyType::Station:  return "station";
    case BodyType::Asteroid: return "asteroid";
  }
  return "unknown";
}

namespace {

std::vector<Destination> buildSol() {
  using T = BodyType;
  return {
    {"sol",       "Sol",       T::Star,     {0, 0, -500},        30.0, ""},

    {"mercury",   "Mercury",   T::Planet,   {80, 10, -420},       1.5, ""},
    {"venus",     "Venus",     T::Planet,   {150, -20, -350},     3.5, ""},
    {"earth",     "Earth",     T::Planet,   {200, 0, -200},       4.0, ""},
    {"luna",      "Luna",      T::Moon,     {220, 8, -185},       1.1, "earth"},
    {"mars",      "Mars",      T::Planet,   {350, -30, -50},      2.5, ""},
    {"phobos",    "Phobos",    T::Moon,     {360, -25, -45},      0.4, "mars"},
    {"deimos",    "Deimos",    T::Moon,     {370, -35, -60},      0.3, "mars"},

    {"ceres",     "Ceres",     T::Dwarf,    {500, 20, 100},       1.2, ""},
    {"vesta",     "Vesta",     T::Asteroid, {480, -15, 150},      0.8, ""},

    {"jupiter",   "Jupiter",   T::Planet,   {700, 40, 400},      15.0, ""},
    {"io",        "Io",        T::Moon,     {730, 45, 390},       1.0, "jupiter"},
    {"europa",    "Europa",    T::Moon,     {745, 35, 410},       0.9, "jupiter"},
    {"ganymede",  "Ganymede",  T::Moon,     {760, 50, 430},       1.5, "jupiter"},
    {"callisto",  "Callisto",  T::Moon,     {780, 30, 450},       1.3, "jupiter"},

    {"saturn",    "Saturn",    T::Planet,   {1000, -50, 800},    13.0, ""},
    {"titan",     "Titan",     T::Moon,     {1040, -40, 820},     1.6, "saturn"},
    {"enceladus", "Enceladus", T::Moon,     {1020, -60, 790},     0.6, "saturn"},
    {"mimas",     "Mimas",     T::Moon,     {985, -45, 780},      0.4, "saturn"},
    {"rhea",      "Rhea",      T::Moon,     {1060, -55, 840},     0.8, "saturn"},

    {"uranus",    "Uranus",    T::Planet,   {1400, 80, 1400},     9.0, ""},
    {"miranda",   "Miranda",   T::Moon,     {1420, 85, 1390},     0.5, "uranus"},
    {"ariel",     "Ariel",     T::Moon,     {1430, 75, 1415},     0.6, "uranus"},
    {"titania",   "Titania",   T::Moon,     {1445, 90, 1425},     0.8, "uranus"},

    {"neptune",   "Neptune",   T::Planet,   {1800, -100, 2000},   8.0, ""},
    {"triton",    "Triton",    T::Moon,     {1830, -95, 2020},    1.2, "neptune"},

    {"pluto",     "Pluto",     T::Dwarf,    {2200, 150, 2500},    1.0, ""},
    {"charon",    "Charon",    T::Moon,     {2215, 155, 2510},    0.6, "pluto"},
    {"eris",      "Eris",      T::Dwarf,    {2800, -200, 3200},   1.05, ""},
    {"dysnomia",  "Dysnomia",  T::Moon,     {2815, -195, 3210},   0.3, "eris"},
    {"makemake",  "Makemake",  T::Dwarf,    {2500, 100, 2800},    0.9, ""},
    {"haumea",    "Haumea",    T::Dwarf,    {2600, -50, 2900},    0.8, ""},

    {"spacedock", "Spacedock", T::Station,  {220, 10, -185},      1.5, "earth"},
    {"deepspace1","Deep Space 1", T::Station, {550, 0, 180},      1.0, ""},
  };
}

} // namespace

const std::vector<Destination>& solCatalog() {
  static const std::vector<Destination> catalog = buildSol();
  return catalog;
}

std::optional<Destination> findDestination(std::string_view key) {
  for (const auto& d : solCatalog()) {
    if (d.key == key) return d;
  }
  return std::nullopt;
}

std::vector<Destination> destinationsByDistance(const math::Vec3d& from) {
  std::vector<Destination> out = solCatalog();
  std::stable_sort(out.begin(), out.end(), [&](const Destination& a, const Destination& b) {
    return (a.position - from).lengthSquared() < (b.position - from).lengthSquared();
  });
  return out;
}

} // namespace starhelm::sim
