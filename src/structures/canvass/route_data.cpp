/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/route_data.h"

#include <numeric>

namespace canvass {

Distance VehicleRoute::legs_distance() const {
  return std::accumulate(waypoints.begin(),
                         waypoints.end(),
                         Distance(0),
                         [](Distance sum, const Waypoint& w) {
                           return sum + w.leg_distance;
                         });
}

std::size_t RouteData::waypoint_count() const {
  std::size_t count = 0;
  for (const auto& r : routes) {
    count += r.waypoints.size();
  }
  return count;
}

IdSet RouteData::stop_ids() const {
  IdSet ids;
  for (const auto& r : routes) {
    for (const auto& w : r.waypoints) {
      if (!w.id.empty()) {
        ids.insert(w.id);
      }
    }
  }
  return ids;
}

void RouteData::update_total_distance() {
  total_distance = 0;
  for (const auto& r : routes) {
    total_distance += r.distance;
  }
}

} // namespace canvass
