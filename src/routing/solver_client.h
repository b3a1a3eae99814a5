#ifndef SOLVER_CLIENT_H
#define SOLVER_CLIENT_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <memory>
#include <optional>
#include <vector>

#include "routing/solver_wrapper.h"
#include "structures/canvass/candidate_set.h"
#include "structures/canvass/route_data.h"

namespace canvass {

// Solver output mapped back onto candidate ids.
struct NormalizedSolution {
  // Depot first, then every vehicle's stops in visiting order.
  std::vector<Id> ordered_stop_ids;
  RouteData route_data;
};

class SolverClient {
private:
  std::unique_ptr<routing::SolverWrapper> _wrapper;

public:
  explicit SolverClient(std::unique_ptr<routing::SolverWrapper> wrapper);

  // Single request to the solver, no retries. Throws InputException on
  // a bad vehicle count and SolverException on an unusable answer.
  NormalizedSolution
  solve(const CandidateSet& candidates,
        unsigned vehicle_count,
        std::optional<Coordinates> depot_override = std::nullopt) const;
};

} // namespace canvass

#endif
