/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/route.h"

#include <algorithm>
#include <cassert>
#include <iterator>

#include <fmt/format.h>

#include "utils/exception.h"

namespace canvass {

std::optional<Index> Route::rank_of(std::string_view route_stop_id) const {
  const auto it = std::ranges::find_if(stops, [&](const auto& rs) {
    return rs.id == route_stop_id;
  });
  if (it == stops.end()) {
    return std::nullopt;
  }
  return static_cast<Index>(std::distance(stops.begin(), it));
}

const RouteStop* Route::find(std::string_view route_stop_id) const {
  const auto rank = rank_of(route_stop_id);
  return rank.has_value() ? &stops[rank.value()] : nullptr;
}

const RouteStop* Route::depot() const {
  const auto it = std::ranges::find_if(stops, &RouteStop::is_depot);
  return (it == stops.end()) ? nullptr : &(*it);
}

IdSet Route::stop_ids() const {
  IdSet ids;
  ids.reserve(stops.size());
  for (const auto& rs : stops) {
    ids.insert(rs.stop_id);
  }
  return ids;
}

std::vector<Id> Route::ordered_stop_ids() const {
  std::vector<Id> ids;
  ids.reserve(stops.size());
  std::ranges::transform(stops, std::back_inserter(ids), &RouteStop::stop_id);
  return ids;
}

void Route::remove(Index rank) {
  assert(rank < stops.size());
  stops.erase(stops.begin() + rank);
  densify();
}

void Route::move(Index rank, Index new_rank) {
  assert(rank < stops.size() && new_rank < stops.size());
  if (rank < new_rank) {
    std::rotate(stops.begin() + rank,
                stops.begin() + rank + 1,
                stops.begin() + new_rank + 1);
  } else if (new_rank < rank) {
    std::rotate(stops.begin() + new_rank,
                stops.begin() + rank,
                stops.begin() + rank + 1);
  }
  densify();
}

void Route::densify() {
  for (Index i = 0; i < stops.size(); ++i) {
    stops[i].order_index = i;
  }
}

std::string to_string(ROUTE_STATUS status) {
  switch (status) {
    using enum ROUTE_STATUS;
  case ACTIVE:
    return "ACTIVE";
  case FINISHED:
    return "FINISHED";
  case CANCELLED:
    return "CANCELLED";
  }
  return "ACTIVE";
}

std::string to_string(ROUTE_TYPE type) {
  switch (type) {
    using enum ROUTE_TYPE;
  case PROPERTY:
    return "PROPERTY";
  case PREFORECLOSURE:
    return "PREFORECLOSURE";
  }
  return "PREFORECLOSURE";
}

ROUTE_STATUS get_route_status(std::string_view s) {
  if (s == "ACTIVE") {
    return ROUTE_STATUS::ACTIVE;
  }
  if (s == "FINISHED") {
    return ROUTE_STATUS::FINISHED;
  }
  if (s == "CANCELLED") {
    return ROUTE_STATUS::CANCELLED;
  }
  throw InputException(fmt::format("Invalid route status: {}.", s));
}

ROUTE_TYPE get_route_type(std::string_view s) {
  if (s == "PROPERTY") {
    return ROUTE_TYPE::PROPERTY;
  }
  if (s == "PREFORECLOSURE") {
    return ROUTE_TYPE::PREFORECLOSURE;
  }
  throw InputException(fmt::format("Invalid route type: {}.", s));
}

} // namespace canvass
