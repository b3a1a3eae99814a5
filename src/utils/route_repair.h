#ifndef ROUTE_REPAIR_H
#define ROUTE_REPAIR_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/route.h"
#include "utils/projection.h"

namespace canvass::utils {

struct RepairReport {
  // Rows whose order index did not match their rank.
  unsigned reindexed_rows{0};
  unsigned duplicate_rows{0};
  unsigned extra_depots{0};
  bool depot_moved{false};
  ProjectionReport projection;

  bool any() const {
    return reindexed_rows + duplicate_rows + extra_depots > 0 || depot_moved ||
           projection.any();
  }
};

// Enforce route invariants after an edit:
// - sort rows by order index, drop rows repeating a stop and
//   re-densify order indices;
// - keep at most one depot and put it at rank 0;
// - project route data from the rows.
RepairReport repair_route(Route& route, const StopLookup& lookup);

std::string describe(const RepairReport& report);

} // namespace canvass::utils

#endif
