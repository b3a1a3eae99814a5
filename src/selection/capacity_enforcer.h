#ifndef CAPACITY_ENFORCER_H
#define CAPACITY_ENFORCER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <vector>

#include "structures/canvass/candidate_set.h"
#include "structures/canvass/input/optimize_request.h"

namespace canvass::selection {

struct CapacityResult {
  CandidateSet candidates;
  std::optional<CapacityWarning> warning;
};

// Clamp eligible stops to MAX_CAPACITY, depot-aware. The depot is put
// first and never evicted, other stops keep their relative order and
// the last ones are evicted when over capacity.
CapacityResult enforce_capacity(std::vector<Stop> eligible,
                                const std::optional<Depot>& depot);

} // namespace canvass::selection

#endif
