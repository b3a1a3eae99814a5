/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "selection/capacity_enforcer.h"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exception.h"

namespace canvass::selection {

CapacityResult enforce_capacity(std::vector<Stop> eligible,
                                const std::optional<Depot>& depot) {
  CapacityResult result;
  auto& stops = result.candidates.stops;

  IdSet seen;
  const auto duplicates = std::ranges::remove_if(eligible, [&](const auto& s) {
    return !seen.insert(s.id).second;
  });
  eligible.erase(duplicates.begin(), duplicates.end());

  if (depot.has_value()) {
    const auto& depot_id = depot.value().stop.id;
    const auto it = std::ranges::find_if(eligible, [&](const auto& s) {
      return s.id == depot_id;
    });
    if (it == eligible.end()) {
      eligible.insert(eligible.begin(), depot.value().stop);
    } else if (it != eligible.begin()) {
      std::rotate(eligible.begin(), it, it + 1);
    }
    result.candidates.depot = depot;
  }

  const std::size_t original = eligible.size();
  if (original > MAX_CAPACITY) {
    eligible.resize(MAX_CAPACITY);
    result.warning = CapacityWarning{original, MAX_CAPACITY};
    spdlog::warn("Too many stops selected: keeping {} of {} candidates.",
                 MAX_CAPACITY,
                 original);
  }
  stops = std::move(eligible);

  if (stops.empty()) {
    throw NoEligibleCandidatesException("No stops to route.");
  }
  if (stops.size() == 1) {
    throw DepotOnlyCandidateSetException(
      fmt::format("No stop to visit besides starting point {}, select at "
                  "least one other stop.",
                  stops.front().id));
  }

  result.candidates.check_invariants();
  return result;
}

} // namespace canvass::selection
