#ifndef ROUTE_H
#define ROUTE_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string>
#include <vector>

#include "structures/canvass/route_data.h"
#include "structures/typedefs.h"

namespace canvass {

struct RouteStop {
  Id id;
  Id stop_id;
  Index order_index{0};
  bool is_depot{false};

  friend bool operator==(const RouteStop& lhs,
                         const RouteStop& rhs) = default;
};

struct Route {
  Id id;
  std::string driver;
  ROUTE_STATUS status{ROUTE_STATUS::ACTIVE};
  ROUTE_TYPE type{ROUTE_TYPE::PREFORECLOSURE};
  std::string created_at;
  std::optional<std::string> finished_at;
  Version version{0};

  // Source of truth for route membership, ordered by order_index.
  std::vector<RouteStop> stops;

  RouteData route_data;

  bool is_active() const {
    return status == ROUTE_STATUS::ACTIVE;
  }

  bool empty() const {
    return stops.empty();
  }

  std::size_t size() const {
    return stops.size();
  }

  // Rank in stops of the row with given id.
  std::optional<Index> rank_of(std::string_view route_stop_id) const;

  const RouteStop* find(std::string_view route_stop_id) const;

  const RouteStop* depot() const;

  bool has_depot() const {
    return depot() != nullptr;
  }

  IdSet stop_ids() const;

  std::vector<Id> ordered_stop_ids() const;

  // Row edits. Order indices are re-densified, route_data is left
  // alone.
  void remove(Index rank);

  void move(Index rank, Index new_rank);

  // Set order_index to the rank of each row.
  void densify();
};

std::string to_string(ROUTE_STATUS status);
std::string to_string(ROUTE_TYPE type);

// Throw InputException on unknown names.
ROUTE_STATUS get_route_status(std::string_view s);
ROUTE_TYPE get_route_type(std::string_view s);

} // namespace canvass

#endif
