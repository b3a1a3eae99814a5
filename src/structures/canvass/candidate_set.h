#ifndef CANDIDATE_SET_H
#define CANDIDATE_SET_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <vector>

#include "structures/canvass/depot.h"

namespace canvass {

// Bounded, depot-first, deduplicated list of stops submitted to the
// solver for one optimize request.
struct CandidateSet {
  std::vector<Stop> stops;
  // When set, stops.front() is the depot stop.
  std::optional<Depot> depot;

  bool empty() const {
    return stops.empty();
  }

  std::size_t size() const {
    return stops.size();
  }

  // Explicit depot, or the first candidate the solver falls back to.
  const Stop& depot_stop() const;

  Coordinates origin() const;

  bool contains(std::string_view id) const;

  // Throw InternalException if capacity, depot position or
  // uniqueness does not hold.
  void check_invariants() const;
};

} // namespace canvass

#endif
