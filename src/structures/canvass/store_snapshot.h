#ifndef STORE_SNAPSHOT_H
#define STORE_SNAPSHOT_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <cstdint>
#include <vector>

#include "structures/canvass/route.h"
#include "structures/canvass/stop.h"

namespace canvass {

// Persisted state of a route store.
struct StoreSnapshot {
  uint64_t next_route{1};
  uint64_t next_route_stop{1};
  std::vector<Stop> stops;
  std::vector<Route> routes;
};

} // namespace canvass

#endif
