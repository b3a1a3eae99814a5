#ifndef COORDINATES_H
#define COORDINATES_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/typedefs.h"

namespace canvass {

struct Coordinates {
  double lat;
  double lon;

  // Great-circle distance in kilometers.
  Distance distance_to(const Coordinates& other) const;

  friend bool operator==(const Coordinates& lhs,
                         const Coordinates& rhs) = default;
};

bool valid_coordinates(double lat, double lon);

} // namespace canvass

#endif
