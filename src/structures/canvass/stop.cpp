/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/stop.h"

#include <utility>

namespace canvass {

Stop::Stop(Id id,
           std::optional<Coordinates> coordinates,
           std::string address,
           bool visited)
  : id(std::move(id)),
    coordinates(coordinates),
    visited(visited),
    address(std::move(address)) {
}

std::string Stop::full_address() const {
  std::string full = address;
  for (const auto* part : {&city, &zip}) {
    if (part->empty()) {
      continue;
    }
    if (!full.empty()) {
      full += ", ";
    }
    full += *part;
  }
  return full;
}

} // namespace canvass
