/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "routing/solver_client.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils/exception.h"
#include "utils/helpers.h"

namespace canvass {

namespace {

// Map a solver waypoint back to a candidate id.
Id resolve_waypoint(const routing::SolverWaypoint& w,
                    const IdMap<const Stop*>& candidates,
                    const Id& depot_id) {
  if (candidates.contains(w.id)) {
    return w.id;
  }
  if (w.original_id.has_value() && candidates.contains(w.original_id.value())) {
    return w.original_id.value();
  }
  if (w.id == SOLVER_DEPOT_ID || w.is_depot) {
    return depot_id;
  }
  throw SolverException(
    fmt::format("Solver returned unknown waypoint {}.", w.id));
}

void set_legs(VehicleRoute& route) {
  for (Index i = 0; i < route.waypoints.size(); ++i) {
    auto& w = route.waypoints[i];
    w.order = i;
    w.leg_distance =
      (i == 0) ? 0
               : route.waypoints[i - 1].coordinates.distance_to(w.coordinates);
  }
}

} // namespace

SolverClient::SolverClient(std::unique_ptr<routing::SolverWrapper> wrapper)
  : _wrapper(std::move(wrapper)) {
  if (_wrapper == nullptr) {
    throw InternalException("Missing solver wrapper.");
  }
}

NormalizedSolution
SolverClient::solve(const CandidateSet& candidates,
                    unsigned vehicle_count,
                    std::optional<Coordinates> depot_override) const {
  utils::check_vehicle_count(vehicle_count);
  candidates.check_invariants();

  const Stop& depot = candidates.depot_stop();
  const Coordinates pin = depot_override.has_value() ? depot_override.value()
                                                     : candidates.origin();

  routing::SolverRequest request;
  request.vehicle_count = vehicle_count;
  request.depot_pin = pin;
  request.depot_id = depot.id;
  request.stops.reserve(candidates.size());

  IdMap<const Stop*> by_id;
  for (const auto& stop : candidates.stops) {
    by_id.try_emplace(stop.id, &stop);
    if (!stop.has_coordinates()) {
      // Only a depot placed by pin may lack stored coordinates.
      if (stop.id != depot.id) {
        throw InternalException(
          fmt::format("Candidate {} has no coordinates.", stop.id));
      }
      request.stops.push_back({stop.id, pin, stop.full_address()});
      continue;
    }
    request.stops.push_back(
      {stop.id, stop.coordinates.value(), stop.full_address()});
  }

  const auto response = _wrapper->solve(request);

  if (!response.success) {
    throw SolverException(
      response.error.empty()
        ? std::string("Solver reported a failure.")
        : fmt::format("Solver reported a failure: {}", response.error));
  }
  if (response.routes.empty()) {
    throw SolverException("Solver returned no route.");
  }

  NormalizedSolution solution;
  auto& data = solution.route_data;
  data.vehicle_count = vehicle_count;
  data.total_distance = response.total_distance;
  data.depot_pin = pin;
  data.depot_address = depot.full_address();

  IdSet placed;
  bool depot_seen = false;
  for (const auto& solver_route : response.routes) {
    VehicleRoute vehicle_route;
    vehicle_route.distance = solver_route.distance;

    IdSet in_vehicle;
    for (const auto& w : solver_route.waypoints) {
      const Id id = resolve_waypoint(w, by_id, depot.id);
      const bool is_depot = (id == depot.id);

      if (!in_vehicle.insert(id).second) {
        continue;
      }
      // A stop is visited by one vehicle only.
      if (!is_depot && !placed.insert(id).second) {
        continue;
      }
      depot_seen = depot_seen || is_depot;

      const Stop& stop = *by_id.find(id)->second;
      Coordinates coordinates = pin;
      if (w.coordinates.has_value()) {
        coordinates = w.coordinates.value();
      } else if (!is_depot && stop.has_coordinates()) {
        coordinates = stop.coordinates.value();
      }

      vehicle_route.waypoints.push_back(
        {id,
         coordinates,
         w.address.empty() ? stop.full_address() : w.address,
         0,
         is_depot,
         0});
    }

    data.routes.push_back(std::move(vehicle_route));
  }

  if (!depot_seen) {
    auto& first = data.routes.front().waypoints;
    first.insert(first.begin(),
                 Waypoint{depot.id, pin, depot.full_address(), 0, true, 0});
  }

  for (auto& vehicle_route : data.routes) {
    set_legs(vehicle_route);
  }
  std::erase_if(data.routes,
                [](const auto& vr) { return vr.waypoints.empty(); });

  solution.ordered_stop_ids.push_back(depot.id);
  for (const auto& vehicle_route : data.routes) {
    for (const auto& w : vehicle_route.waypoints) {
      if (!w.is_depot) {
        solution.ordered_stop_ids.push_back(w.id);
      }
    }
  }

  if (solution.ordered_stop_ids.size() < 2) {
    throw SolverException("Solver returned no stop to visit.");
  }

  std::vector<Id> missing;
  for (const auto& stop : candidates.stops) {
    if (stop.id != depot.id && !placed.contains(stop.id)) {
      missing.push_back(stop.id);
    }
  }
  if (!missing.empty()) {
    spdlog::warn("Solver left out {} candidate(s): {}.",
                 missing.size(),
                 fmt::join(missing, ", "));
  }

  return solution;
}

} // namespace canvass
