#ifndef DEPOT_H
#define DEPOT_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/stop.h"

namespace canvass {

struct Depot {
  Stop stop;
  // Literal routing origin, may differ slightly from the stop
  // coordinates.
  Coordinates pin;
};

} // namespace canvass

#endif
