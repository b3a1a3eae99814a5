#ifndef TYPEDEFS_H
#define TYPEDEFS_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace canvass {

// To easily differentiate variable types.
using Id = std::string;
using Index = std::size_t;
using Distance = double;
using Version = uint64_t;

// Heterogeneous lookup for string keyed containers.
struct StringHash {
  using hash_type = std::hash<std::string_view>;
  using is_transparent = void;

  std::size_t operator()(const char* str) const {
    return hash_type{}(str);
  }
  std::size_t operator()(std::string_view str) const {
    return hash_type{}(str);
  }
  std::size_t operator()(const std::string& str) const {
    return hash_type{}(str);
  }
};

using IdSet = std::unordered_set<Id, StringHash, std::equal_to<>>;

template <typename T>
using IdMap = std::unordered_map<Id, T, StringHash, std::equal_to<>>;

// One depot plus 24 stops to visit. This is the only place the
// capacity is defined.
constexpr std::size_t MAX_CAPACITY = 25;

constexpr unsigned MIN_VEHICLES = 1;
constexpr unsigned MAX_VEHICLES = 2;

// Directions URLs only accept that many points.
constexpr std::size_t MAX_DIRECTIONS_WAYPOINTS = 25;

constexpr double EARTH_RADIUS_KM = 6371.0;

// Id used by the solver for its synthetic depot waypoint.
const std::string SOLVER_DEPOT_ID = "depot";

const std::string DEFAULT_SOLVER_HOST = "localhost";
const std::string DEFAULT_SOLVER_PORT = "8080";
const std::string DEFAULT_SOLVER_PATH = "/api/routing/solve";
constexpr unsigned DEFAULT_SOLVER_TIMEOUT_MS = 30000;

// Error types.
enum class ERROR {
  INTERNAL,
  INPUT,
  SOLVER,
  NO_CANDIDATES,
  DEPOT_CONFLICT,
  DEPOT_ONLY,
  NOT_FOUND,
  CONFLICT,
  DEPOT_REMOVAL
};

// Route lifecycle.
enum class ROUTE_STATUS { ACTIVE, FINISHED, CANCELLED };

// Kind of lead records a route is built from.
enum class ROUTE_TYPE { PROPERTY, PREFORECLOSURE };

// Reasons for refusing a depot designation.
enum class DEPOT_CONFLICT { ALREADY_DEPOT, ALREADY_ROUTED };

} // namespace canvass

#endif
