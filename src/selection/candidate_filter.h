#ifndef CANDIDATE_FILTER_H
#define CANDIDATE_FILTER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <vector>

#include "structures/canvass/area.h"
#include "structures/canvass/stop.h"

namespace canvass::selection {

struct CandidateQuery {
  // Stops already committed to some ACTIVE route.
  IdSet routed_ids;
  std::optional<Area> area;
  std::optional<std::vector<Id>> selection;
  // Exempt from all exclusion rules.
  std::optional<Id> depot_id;
};

struct FilterCounters {
  unsigned missing_coordinates{0};
  unsigned visited{0};
  unsigned routed{0};
  unsigned outside_area{0};
  unsigned not_selected{0};
  unsigned unknown{0};
  unsigned duplicates{0};
};

struct FilterResult {
  std::vector<Stop> stops;
  FilterCounters excluded;
};

// Eligible stops, deduplicated by id with the first occurrence kept,
// in selection order if a selection is provided and in lead order
// otherwise. Throws NoEligibleCandidatesException on empty result.
FilterResult filter_candidates(const std::vector<Stop>& leads,
                               const CandidateQuery& query);

} // namespace canvass::selection

#endif
