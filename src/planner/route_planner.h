#ifndef ROUTE_PLANNER_H
#define ROUTE_PLANNER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "routing/solver_client.h"
#include "store/route_store.h"
#include "structures/canvass/input/optimize_request.h"

namespace canvass {

class RoutePlanner {
private:
  RouteStore& _store;
  const SolverClient& _solver;

public:
  RoutePlanner(RouteStore& store, const SolverClient& solver);

  // Filter leads, resolve the depot, clamp to capacity, solve and
  // store the resulting route. Nothing is stored on failure.
  OptimizeResult optimize(const OptimizeRequest& request) const;
};

} // namespace canvass

#endif
