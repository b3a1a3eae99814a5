/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "selection/candidate_filter.h"

#include <spdlog/spdlog.h>

#include "utils/exception.h"

namespace canvass::selection {

namespace {

bool is_eligible(const Stop& stop,
                 const CandidateQuery& query,
                 FilterCounters& excluded) {
  if (query.depot_id.has_value() && stop.id == query.depot_id.value()) {
    return true;
  }
  if (!stop.has_coordinates()) {
    ++excluded.missing_coordinates;
    return false;
  }
  if (stop.visited) {
    ++excluded.visited;
    return false;
  }
  if (query.routed_ids.contains(stop.id)) {
    ++excluded.routed;
    return false;
  }
  if (query.area.has_value() &&
      !area_contains(query.area.value(), stop.coordinates.value())) {
    ++excluded.outside_area;
    return false;
  }
  return true;
}

} // namespace

FilterResult filter_candidates(const std::vector<Stop>& leads,
                               const CandidateQuery& query) {
  FilterResult result;
  auto& excluded = result.excluded;
  IdSet seen;

  const auto consider = [&](const Stop& stop) {
    if (seen.contains(stop.id)) {
      ++excluded.duplicates;
      return;
    }
    if (is_eligible(stop, query, excluded)) {
      seen.insert(stop.id);
      result.stops.push_back(stop);
    }
  };

  if (query.selection.has_value()) {
    IdMap<const Stop*> by_id;
    for (const auto& stop : leads) {
      by_id.try_emplace(stop.id, &stop);
    }

    const auto& selection = query.selection.value();
    IdSet selected(selection.begin(), selection.end());
    for (const auto& id : selection) {
      const auto it = by_id.find(id);
      if (it == by_id.end()) {
        ++excluded.unknown;
        continue;
      }
      consider(*(it->second));
    }

    // A depot picked outside the selection is still a candidate.
    if (query.depot_id.has_value() &&
        !selected.contains(query.depot_id.value())) {
      const auto depot = by_id.find(query.depot_id.value());
      if (depot != by_id.end()) {
        consider(*(depot->second));
      }
    }
    for (const auto& [id, stop] : by_id) {
      if (!selected.contains(id) && id != query.depot_id) {
        ++excluded.not_selected;
      }
    }
  } else {
    for (const auto& stop : leads) {
      consider(stop);
    }
  }

  spdlog::debug("Candidate filter kept {} of {} lead(s): {} without "
                "coordinates, {} visited, {} routed, {} outside area, {} not "
                "selected, {} unknown, {} duplicate(s).",
                result.stops.size(),
                leads.size(),
                excluded.missing_coordinates,
                excluded.visited,
                excluded.routed,
                excluded.outside_area,
                excluded.not_selected,
                excluded.unknown,
                excluded.duplicates);

  if (result.stops.empty()) {
    throw NoEligibleCandidatesException(
      "No eligible stops left to route after filtering.");
  }

  return result;
}

} // namespace canvass::selection
