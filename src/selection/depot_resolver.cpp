/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "selection/depot_resolver.h"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exception.h"
#include "utils/helpers.h"

namespace canvass::selection {

namespace {

void check_pin(const Coordinates& pin) {
  if (!valid_coordinates(pin.lat, pin.lon)) {
    throw InputException(
      fmt::format("Invalid starting point pin: {}, {}.", pin.lat, pin.lon));
  }
}

Depot depot_from_stop_id(const DepotSelection& selection,
                         const std::vector<Stop>& leads,
                         std::vector<Stop>& candidates,
                         const utils::RoutedIndex& index) {
  const auto& stop_id = selection.stop_id.value();
  check_depot_available(index, stop_id);

  const auto same_id = [&](const Stop& s) { return s.id == stop_id; };

  auto candidate = std::ranges::find_if(candidates, same_id);
  const bool in_candidates = (candidate != candidates.end());

  Stop stop;
  if (in_candidates) {
    stop = *candidate;
  } else {
    const auto lead = std::ranges::find_if(leads, same_id);
    if (lead == leads.end()) {
      throw InputException(
        fmt::format("Unknown starting point stop {}.", stop_id));
    }
    stop = *lead;
  }

  if (!selection.pin.has_value() && !stop.has_coordinates()) {
    throw InputException(
      fmt::format("Starting point stop {} has no coordinates and no pin was "
                  "provided.",
                  stop_id));
  }
  const Coordinates pin = selection.pin.has_value()
                            ? selection.pin.value()
                            : stop.coordinates.value();
  check_pin(pin);
  if (!stop.has_coordinates()) {
    stop.coordinates = pin;
  }

  if (in_candidates) {
    *candidate = stop;
  } else {
    // Depot falls outside the filtered set, force it in.
    candidates.insert(candidates.begin(), stop);
  }

  return {stop, pin};
}

Depot depot_from_pin(const Coordinates& pin,
                     std::vector<Stop>& candidates,
                     const utils::RoutedIndex& index) {
  check_pin(pin);

  const auto closest = utils::closest_stop(candidates, pin);
  if (!closest.has_value()) {
    throw NoEligibleCandidatesException(
      "No stop with coordinates near the starting point.");
  }
  const auto& stop = candidates[closest.value()];
  check_depot_available(index, stop.id);

  spdlog::debug("Starting point pin {}, {} resolved to closest stop {}.",
                pin.lat,
                pin.lon,
                stop.id);
  return {stop, pin};
}

} // namespace

void check_depot_available(const utils::RoutedIndex& index,
                           const Id& stop_id) {
  if (const auto it = index.depot_routes.find(stop_id);
      it != index.depot_routes.end()) {
    throw DepotConflictException(DEPOT_CONFLICT::ALREADY_DEPOT,
                                 stop_id,
                                 it->second);
  }
  if (const auto it = index.member_routes.find(stop_id);
      it != index.member_routes.end()) {
    throw DepotConflictException(DEPOT_CONFLICT::ALREADY_ROUTED,
                                 stop_id,
                                 it->second);
  }
}

std::optional<Depot>
resolve_depot(const std::optional<DepotSelection>& selection,
              const std::vector<Stop>& leads,
              std::vector<Stop>& candidates,
              const utils::RoutedIndex& index) {
  if (!selection.has_value()) {
    return std::nullopt;
  }

  if (selection.value().stop_id.has_value()) {
    return depot_from_stop_id(selection.value(), leads, candidates, index);
  }

  if (selection.value().pin.has_value()) {
    return depot_from_pin(selection.value().pin.value(), candidates, index);
  }

  return std::nullopt;
}

} // namespace canvass::selection
