/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "planner/route_planner.h"

#include <spdlog/spdlog.h>

#include "selection/candidate_filter.h"
#include "selection/capacity_enforcer.h"
#include "selection/depot_resolver.h"
#include "utils/helpers.h"

namespace canvass {

RoutePlanner::RoutePlanner(RouteStore& store, const SolverClient& solver)
  : _store(store), _solver(solver) {
}

OptimizeResult RoutePlanner::optimize(const OptimizeRequest& request) const {
  _store.check_driver(request.driver);
  utils::check_vehicle_count(request.vehicle_count);
  if (request.area.has_value()) {
    check_area(request.area.value());
  }

  const auto leads = _store.stops();
  const auto index = _store.routed_index();

  selection::CandidateQuery query;
  query.routed_ids = index.routed_ids();
  query.area = request.area;
  query.selection = request.selection;
  if (request.depot.has_value()) {
    query.depot_id = request.depot.value().stop_id;
  }

  auto filtered = selection::filter_candidates(leads, query);
  const auto depot =
    selection::resolve_depot(request.depot, leads, filtered.stops, index);
  auto capacity = selection::enforce_capacity(std::move(filtered.stops), depot);

  spdlog::debug("Solving {} candidate(s) with {} vehicle(s) for {}.",
                capacity.candidates.size(),
                request.vehicle_count,
                request.driver);

  auto solution = _solver.solve(capacity.candidates, request.vehicle_count);

  auto route = _store.create_route(request.driver,
                                   request.type,
                                   solution.ordered_stop_ids,
                                   std::move(solution.route_data));

  spdlog::info("Optimized route {} for {}: {} stop(s), {:.2f} km.",
               route.id,
               route.driver,
               route.size(),
               route.route_data.total_distance);

  return {std::move(route), capacity.warning};
}

} // namespace canvass
