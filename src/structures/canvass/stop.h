#ifndef STOP_H
#define STOP_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <optional>
#include <string>

#include "structures/canvass/coordinates.h"
#include "structures/typedefs.h"

namespace canvass {

// A lead record usable as a routing point.
struct Stop {
  Id id;
  std::optional<Coordinates> coordinates;
  bool visited{false};
  std::optional<std::string> visited_by;
  // ISO 8601, UTC.
  std::optional<std::string> visited_at;
  // Display and matching only.
  std::string address;
  std::string city;
  std::string zip;

  Stop() = default;

  Stop(Id id,
       std::optional<Coordinates> coordinates,
       std::string address = "",
       bool visited = false);

  bool has_coordinates() const {
    return coordinates.has_value();
  }

  // Address with city and zip, as sent to the solver.
  std::string full_address() const;
};

} // namespace canvass

#endif
