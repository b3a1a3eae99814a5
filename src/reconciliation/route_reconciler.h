#ifndef ROUTE_RECONCILER_H
#define ROUTE_RECONCILER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string_view>

#include "store/route_store.h"

namespace canvass {

// Local edits on solved routes. The solver is never called again, the
// cached geometry is projected from the edited rows.
class RouteReconciler {
private:
  RouteStore& _store;

public:
  explicit RouteReconciler(RouteStore& store);

  // Removing a row that is already gone only runs the repair pass.
  // Removing the depot throws DepotRemovalException unless confirmed.
  Route remove(std::string_view route_id,
               std::string_view route_stop_id,
               bool confirm_depot_removal = false,
               std::optional<Version> expected_version = std::nullopt);

  // new_index is clamped to the positions after the depot.
  Route reorder(std::string_view route_id,
                std::string_view route_stop_id,
                Index new_index,
                std::optional<Version> expected_version = std::nullopt);

  // Make an existing row the depot of a route that has none.
  Route assign_depot(std::string_view route_id,
                     std::string_view route_stop_id,
                     std::optional<Version> expected_version = std::nullopt);

  Route repair(std::string_view route_id);
};

} // namespace canvass

#endif
