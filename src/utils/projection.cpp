/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/projection.h"

#include <algorithm>

#include "utils/helpers.h"

namespace canvass::utils {

IdSet RoutedIndex::routed_ids() const {
  IdSet ids;
  ids.reserve(depot_routes.size() + member_routes.size());
  for (const auto& [stop_id, route_id] : depot_routes) {
    ids.insert(stop_id);
  }
  for (const auto& [stop_id, route_id] : member_routes) {
    ids.insert(stop_id);
  }
  return ids;
}

bool RoutedIndex::is_routed(std::string_view stop_id) const {
  return depot_routes.contains(stop_id) || member_routes.contains(stop_id);
}

RoutedIndex index_routes(const std::vector<Route>& routes) {
  RoutedIndex index;
  for (const auto& route : routes) {
    if (!route.is_active()) {
      continue;
    }
    for (const auto& rs : route.stops) {
      if (rs.is_depot) {
        index.depot_routes.try_emplace(rs.stop_id, route.id);
      } else {
        index.member_routes.try_emplace(rs.stop_id, route.id);
      }
    }
  }
  return index;
}

namespace {

struct RowInfo {
  Index order_index;
  bool is_depot;
};

// Match a waypoint without id against the stops of remaining rows. An
// exact normalized match wins, then the longest stop address the
// waypoint address starts with.
std::optional<Id> match_by_address(const Waypoint& w,
                                   const std::vector<RouteStop>& rows,
                                   const StopLookup& lookup,
                                   const IdSet& already_matched) {
  const auto address = normalize_address(w.address);
  if (address.empty()) {
    return std::nullopt;
  }

  std::optional<Id> best;
  std::size_t best_length = 0;
  for (const auto& rs : rows) {
    if (already_matched.contains(rs.stop_id)) {
      continue;
    }
    const auto stop = lookup(rs.stop_id);
    if (!stop.has_value()) {
      continue;
    }
    if (address == normalize_address(stop.value().address) ||
        address == normalize_address(stop.value().full_address())) {
      return rs.stop_id;
    }
    if (address_matches(w.address, stop.value())) {
      const auto length = normalize_address(stop.value().address).size();
      if (length > best_length) {
        best = rs.stop_id;
        best_length = length;
      }
    }
  }
  return best;
}

} // namespace

RouteData project_route_data(const RouteData& data,
                             const std::vector<RouteStop>& rows,
                             const StopLookup& lookup,
                             ProjectionReport& report) {
  IdMap<RowInfo> row_info;
  for (const auto& rs : rows) {
    row_info.try_emplace(rs.stop_id, RowInfo{rs.order_index, rs.is_depot});
  }

  RouteData projected = data;
  projected.routes.clear();

  // Non-depot stops belong to a single vehicle route, the depot may
  // start all of them.
  IdSet placed;
  IdSet address_matched;

  for (const auto& vehicle : data.routes) {
    VehicleRoute current;
    current.distance = vehicle.distance;
    IdSet in_vehicle;

    for (auto w : vehicle.waypoints) {
      if (w.id.empty()) {
        auto matched = match_by_address(w, rows, lookup, address_matched);
        if (!matched.has_value()) {
          ++report.dropped_waypoints;
          continue;
        }
        w.id = std::move(matched.value());
        address_matched.insert(w.id);
        ++report.address_matches;
      }

      const auto info = row_info.find(w.id);
      if (info == row_info.end()) {
        ++report.dropped_waypoints;
        continue;
      }
      const bool is_depot = info->second.is_depot;
      if (in_vehicle.contains(w.id) || (!is_depot && placed.contains(w.id))) {
        ++report.duplicate_waypoints;
        continue;
      }

      w.is_depot = is_depot;
      in_vehicle.insert(w.id);
      placed.insert(w.id);
      current.waypoints.push_back(std::move(w));
    }

    if (!current.waypoints.empty()) {
      projected.routes.push_back(std::move(current));
    }
  }

  // Rows without geometry get a waypoint built from the stop itself.
  for (const auto& rs : rows) {
    if (placed.contains(rs.stop_id)) {
      continue;
    }

    Waypoint w;
    w.id = rs.stop_id;
    w.is_depot = rs.is_depot;
    const auto stop = lookup(rs.stop_id);
    if (stop.has_value() && stop.value().has_coordinates()) {
      w.coordinates = stop.value().coordinates.value();
      w.address = stop.value().full_address();
    } else if (data.depot_pin.has_value()) {
      w.coordinates = data.depot_pin.value();
    }

    if (projected.routes.empty()) {
      projected.routes.emplace_back();
    }
    auto& target = projected.routes.front().waypoints;
    if (!target.empty()) {
      w.leg_distance = target.back().coordinates.distance_to(w.coordinates);
    }
    target.push_back(std::move(w));
    placed.insert(rs.stop_id);
    ++report.synthesized_waypoints;
  }

  for (auto& vehicle : projected.routes) {
    std::ranges::stable_sort(vehicle.waypoints,
                             std::less<>{},
                             [&](const Waypoint& w) {
                               return row_info.at(w.id).order_index;
                             });
    for (Index i = 0; i < vehicle.waypoints.size(); ++i) {
      vehicle.waypoints[i].order = i;
    }
  }

  return projected;
}

} // namespace canvass::utils
