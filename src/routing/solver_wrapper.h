#ifndef SOLVER_WRAPPER_H
#define SOLVER_WRAPPER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string>
#include <vector>

#include "structures/canvass/coordinates.h"
#include "structures/typedefs.h"

namespace canvass::routing {

struct SolverStop {
  Id id;
  Coordinates coordinates;
  std::string address;
};

struct SolverRequest {
  std::vector<SolverStop> stops;
  unsigned vehicle_count{1};
  std::optional<Coordinates> depot_pin;
  std::optional<Id> depot_id;
};

struct SolverWaypoint {
  std::string id;
  std::optional<std::string> original_id;
  std::optional<Coordinates> coordinates;
  std::string address;
  bool is_depot{false};
};

struct SolverRoute {
  std::vector<SolverWaypoint> waypoints;
  Distance distance{0};
};

struct SolverResponse {
  bool success{false};
  std::vector<SolverRoute> routes;
  Distance total_distance{0};
  // Error reported by the solver, if any.
  std::string error;
};

// Access to the external vehicle routing solver.
class SolverWrapper {
public:
  // One request, one response. Throws SolverException if the solver
  // cannot be reached or answers garbage.
  virtual SolverResponse solve(const SolverRequest& request) const = 0;

  virtual ~SolverWrapper() = default;
};

} // namespace canvass::routing

#endif
