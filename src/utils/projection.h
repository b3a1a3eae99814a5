#ifndef PROJECTION_H
#define PROJECTION_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "structures/canvass/route.h"
#include "structures/canvass/stop.h"

namespace canvass::utils {

using StopLookup = std::function<std::optional<Stop>(std::string_view)>;

// Which stops are used by ACTIVE routes, derived on demand from the
// route rows.
struct RoutedIndex {
  // Stop id to id of the route it is the depot of.
  IdMap<Id> depot_routes;
  // Stop id to id of the route it is a non-depot stop of.
  IdMap<Id> member_routes;

  IdSet routed_ids() const;

  bool is_routed(std::string_view stop_id) const;
};

RoutedIndex index_routes(const std::vector<Route>& routes);

// Drift found while projecting waypoints from route rows.
struct ProjectionReport {
  unsigned dropped_waypoints{0};
  unsigned duplicate_waypoints{0};
  unsigned synthesized_waypoints{0};
  unsigned address_matches{0};

  bool any() const {
    return dropped_waypoints + duplicate_waypoints + synthesized_waypoints +
             address_matches >
           0;
  }
};

// Rebuild waypoint lists so they reference exactly the stops of the
// given rows, each vehicle route ordered by row order and relabeled.
// Existing geometry is kept, distances are not recomputed.
RouteData project_route_data(const RouteData& data,
                             const std::vector<RouteStop>& rows,
                             const StopLookup& lookup,
                             ProjectionReport& report);

} // namespace canvass::utils

#endif
