#ifndef DEPOT_RESOLVER_H
#define DEPOT_RESOLVER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <vector>

#include "structures/canvass/depot.h"
#include "structures/canvass/input/optimize_request.h"
#include "utils/projection.h"

namespace canvass::selection {

// Throw DepotConflictException if stop_id is used by an ACTIVE route.
void check_depot_available(const utils::RoutedIndex& index,
                           const Id& stop_id);

// Resolve the operator's depot selection against the lead universe.
// - With a stop id, that stop is the depot and the pin defaults to
//   its coordinates.
// - With a pin only, the closest candidate is the depot.
// - Without selection, no depot is designated and the solver starts
//   from the first candidate.
// The returned depot stop is guaranteed to be part of candidates.
std::optional<Depot>
resolve_depot(const std::optional<DepotSelection>& selection,
              const std::vector<Stop>& leads,
              std::vector<Stop>& candidates,
              const utils::RoutedIndex& index);

} // namespace canvass::selection

#endif
