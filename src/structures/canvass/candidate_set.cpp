/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/candidate_set.h"

#include <algorithm>

#include <fmt/format.h>

#include "utils/exception.h"

namespace canvass {

const Stop& CandidateSet::depot_stop() const {
  if (stops.empty()) {
    throw InternalException("No depot in empty candidate set.");
  }
  return stops.front();
}

Coordinates CandidateSet::origin() const {
  if (depot.has_value()) {
    return depot.value().pin;
  }
  const auto& first = depot_stop();
  if (!first.has_coordinates()) {
    throw InternalException(
      fmt::format("Candidate {} has no coordinates.", first.id));
  }
  return first.coordinates.value();
}

bool CandidateSet::contains(std::string_view id) const {
  return std::ranges::any_of(stops,
                             [&](const auto& s) { return s.id == id; });
}

void CandidateSet::check_invariants() const {
  if (stops.size() > MAX_CAPACITY) {
    throw InternalException(
      fmt::format("Candidate set of size {} over capacity.", stops.size()));
  }
  if (depot.has_value() &&
      (stops.empty() || stops.front().id != depot.value().stop.id)) {
    throw InternalException("Depot is not the first candidate.");
  }
  IdSet seen;
  for (const auto& s : stops) {
    if (!seen.insert(s.id).second) {
      throw InternalException(fmt::format("Duplicate candidate {}.", s.id));
    }
  }
}

} // namespace canvass
