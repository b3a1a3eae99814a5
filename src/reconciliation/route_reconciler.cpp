/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "reconciliation/route_reconciler.h"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exception.h"
#include "utils/route_repair.h"

namespace canvass {

namespace {

// Run the repair pass and log any drift it fixed.
bool repair_and_log(Route& route, const utils::StopLookup& lookup) {
  const auto report = utils::repair_route(route, lookup);
  if (report.any()) {
    spdlog::warn("Repaired route {}: {}.", route.id, utils::describe(report));
  }
  return report.any();
}

} // namespace

RouteReconciler::RouteReconciler(RouteStore& store) : _store(store) {
}

Route RouteReconciler::remove(std::string_view route_id,
                              std::string_view route_stop_id,
                              bool confirm_depot_removal,
                              std::optional<Version> expected_version) {
  Id removed_stop;

  auto route = _store.update(
    route_id,
    [&](Route& r, const utils::StopLookup& lookup) {
      const auto rank = r.rank_of(route_stop_id);
      if (!rank.has_value()) {
        // Already removed.
        return repair_and_log(r, lookup);
      }

      const RouteStop row = r.stops[rank.value()];
      if (row.is_depot && !confirm_depot_removal) {
        throw DepotRemovalException(
          fmt::format("Stop {} is the depot of route {}, removal must be "
                      "confirmed.",
                      row.stop_id,
                      r.id));
      }

      r.remove(rank.value());
      // Only vehicle routes that lost a waypoint get their distance
      // approximated by the remaining legs.
      for (auto& vehicle : r.route_data.routes) {
        if (std::erase_if(vehicle.waypoints, [&](const auto& w) {
              return w.id == row.stop_id;
            }) > 0) {
          vehicle.distance = vehicle.legs_distance();
        }
      }
      if (row.is_depot) {
        r.route_data.depot_pin.reset();
        r.route_data.depot_address.clear();
      }

      repair_and_log(r, lookup);
      r.route_data.update_total_distance();

      removed_stop = row.stop_id;
      return true;
    },
    expected_version);

  if (!removed_stop.empty()) {
    spdlog::info("Removed stop {} from route {}, {} stop(s) left.",
                 removed_stop,
                 route.id,
                 route.size());
  }
  return route;
}

Route RouteReconciler::reorder(std::string_view route_id,
                               std::string_view route_stop_id,
                               Index new_index,
                               std::optional<Version> expected_version) {
  std::optional<Index> moved_to;

  auto route = _store.update(
    route_id,
    [&](Route& r, const utils::StopLookup& lookup) {
      const auto rank = r.rank_of(route_stop_id);
      if (!rank.has_value()) {
        throw NotFoundException(fmt::format("Unknown stop row {} in route {}.",
                                            route_stop_id,
                                            r.id));
      }

      if (r.stops[rank.value()].is_depot) {
        if (new_index == 0) {
          return repair_and_log(r, lookup);
        }
        throw InputException(
          fmt::format("The depot of route {} can't be moved.", r.id));
      }

      const Index first = r.has_depot() ? 1 : 0;
      const Index target = std::clamp(new_index, first, r.size() - 1);
      if (target == rank.value()) {
        return repair_and_log(r, lookup);
      }

      r.move(rank.value(), target);
      repair_and_log(r, lookup);

      moved_to = target;
      return true;
    },
    expected_version);

  if (moved_to.has_value()) {
    spdlog::info("Moved row {} of route {} to position {}.",
                 route_stop_id,
                 route.id,
                 moved_to.value());
  }
  return route;
}

Route RouteReconciler::assign_depot(std::string_view route_id,
                                    std::string_view route_stop_id,
                                    std::optional<Version> expected_version) {
  bool assigned = false;

  auto route = _store.update(
    route_id,
    [&](Route& r, const utils::StopLookup& lookup) {
      const auto rank = r.rank_of(route_stop_id);
      if (!rank.has_value()) {
        throw NotFoundException(fmt::format("Unknown stop row {} in route {}.",
                                            route_stop_id,
                                            r.id));
      }

      const auto* depot = r.depot();
      if (depot != nullptr) {
        if (depot->id == route_stop_id) {
          return repair_and_log(r, lookup);
        }
        throw InputException(
          fmt::format("Route {} already has depot {}.", r.id, depot->stop_id));
      }

      r.stops[rank.value()].is_depot = true;
      r.move(rank.value(), 0);

      const auto stop = lookup(r.stops.front().stop_id);
      if (stop.has_value() && stop.value().has_coordinates()) {
        r.route_data.depot_pin = stop.value().coordinates.value();
        r.route_data.depot_address = stop.value().full_address();
      }

      repair_and_log(r, lookup);
      assigned = true;
      return true;
    },
    expected_version);

  if (assigned) {
    spdlog::info("Stop {} is now the depot of route {}.",
                 route.stops.front().stop_id,
                 route.id);
  }
  return route;
}

Route RouteReconciler::repair(std::string_view route_id) {
  return _store.update(route_id, repair_and_log);
}

} // namespace canvass
