#ifndef ROUTE_DATA_H
#define ROUTE_DATA_H

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

namespace canvass {

struct Waypoint {
  // Stop id, may be empty in legacy stored geometry.
  Id id;
  Coordinates coordinates{0, 0};
  std::string address;
  Index order{0};
  bool is_depot{false};
  // Distance from the previous waypoint of the same vehicle route.
  Distance leg_distance{0};
};

struct VehicleRoute {
  std::vector<Waypoint> waypoints;
  Distance distance{0};

  // Sum of leg distances, an approximation of a re-solved distance.
  Distance legs_distance() const;
};

// Solver geometry cached for display. Derived from the route stop
// rows after any edit.
struct RouteData {
  unsigned vehicle_count{1};
  std::vector<VehicleRoute> routes;
  Distance total_distance{0};
  std::optional<Coordinates> depot_pin;
  std::string depot_address;

  bool empty() const {
    return routes.empty();
  }

  std::size_t waypoint_count() const;

  IdSet stop_ids() const;

  // Total as the sum of vehicle route distances.
  void update_total_distance();
};

} // namespace canvass

#endif
