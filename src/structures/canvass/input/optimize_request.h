#ifndef OPTIMIZE_REQUEST_H
#define OPTIMIZE_REQUEST_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string>
#include <vector>

#include "structures/canvass/area.h"
#include "structures/canvass/route.h"

namespace canvass {

// Depot as picked by the operator: a stop, a pin on the map, or both.
struct DepotSelection {
  std::optional<Id> stop_id;
  std::optional<Coordinates> pin;
};

struct OptimizeRequest {
  std::string driver;
  ROUTE_TYPE type{ROUTE_TYPE::PREFORECLOSURE};
  unsigned vehicle_count{1};
  std::optional<Area> area;
  // Explicit stop selection, in selection order.
  std::optional<std::vector<Id>> selection;
  std::optional<DepotSelection> depot;
};

// Emitted when the candidate list had to be truncated.
struct CapacityWarning {
  std::size_t original;
  std::size_t final;
};

struct OptimizeResult {
  Route route;
  std::optional<CapacityWarning> warning;
};

} // namespace canvass

#endif
