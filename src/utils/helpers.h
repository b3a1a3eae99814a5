#ifndef HELPERS_H
#define HELPERS_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "structures/canvass/route_data.h"
#include "structures/canvass/stop.h"
#include "structures/typedefs.h"
#include "utils/exception.h"

namespace canvass::utils {

// Current UTC time as ISO 8601 with millisecond precision.
std::string now_iso8601();

// Lower-case, alphanumeric words separated by single spaces.
std::string normalize_address(std::string_view address);

// A waypoint address matches a stop if its normalized form starts with
// the normalized stop address on a word boundary.
bool address_matches(std::string_view waypoint_address, const Stop& stop);

inline void check_vehicle_count(unsigned vehicle_count) {
  if (vehicle_count < MIN_VEHICLES || MAX_VEHICLES < vehicle_count) {
    throw InputException("Vehicle count must be 1 or 2.");
  }
}

void check_driver(const std::vector<std::string>& drivers,
                  std::string_view driver);

// Index of the candidate closest to c, if any has coordinates.
std::optional<Index> closest_stop(const std::vector<Stop>& stops,
                                  const Coordinates& c);

// Directions URL over the first MAX_DIRECTIONS_WAYPOINTS waypoints.
std::string directions_url(const VehicleRoute& route);

} // namespace canvass::utils

#endif
