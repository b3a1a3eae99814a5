/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/route_repair.h"

#include <algorithm>

#include <fmt/format.h>

namespace canvass::utils {

RepairReport repair_route(Route& route, const StopLookup& lookup) {
  RepairReport report;
  auto& rows = route.stops;

  std::ranges::stable_sort(rows, std::less<>{}, &RouteStop::order_index);

  IdSet seen;
  const auto duplicates = std::ranges::remove_if(rows, [&](const auto& rs) {
    return !seen.insert(rs.stop_id).second;
  });
  report.duplicate_rows = static_cast<unsigned>(duplicates.size());
  rows.erase(duplicates.begin(), duplicates.end());

  // First depot in order wins.
  bool has_depot = false;
  for (auto& rs : rows) {
    if (!rs.is_depot) {
      continue;
    }
    if (has_depot) {
      rs.is_depot = false;
      ++report.extra_depots;
    }
    has_depot = true;
  }

  if (has_depot && !rows.front().is_depot) {
    const auto depot = std::ranges::find_if(rows, &RouteStop::is_depot);
    std::rotate(rows.begin(), depot, depot + 1);
    report.depot_moved = true;
  }

  for (Index i = 0; i < rows.size(); ++i) {
    if (rows[i].order_index != i) {
      ++report.reindexed_rows;
    }
  }
  route.densify();

  route.route_data =
    project_route_data(route.route_data, rows, lookup, report.projection);

  return report;
}

std::string describe(const RepairReport& report) {
  const auto& p = report.projection;
  return fmt::format("{} reindexed row(s), {} duplicate row(s), {} extra "
                     "depot(s), depot moved: {}, {} dropped waypoint(s), {} "
                     "duplicate waypoint(s), {} synthesized waypoint(s), {} "
                     "address match(es)",
                     report.reindexed_rows,
                     report.duplicate_rows,
                     report.extra_depots,
                     report.depot_moved,
                     p.dropped_waypoints,
                     p.duplicate_waypoints,
                     p.synthesized_waypoints,
                     p.address_matches);
}

} // namespace canvass::utils
