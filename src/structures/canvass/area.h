#ifndef AREA_H
#define AREA_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <variant>
#include <vector>

#include "structures/canvass/coordinates.h"

namespace canvass {

struct Rectangle {
  double north;
  double south;
  double east;
  double west;

  bool contains(const Coordinates& c) const;
};

struct Circle {
  Coordinates center;
  // In meters.
  double radius;

  bool contains(const Coordinates& c) const;
};

struct Polygon {
  std::vector<Coordinates> vertices;

  // Ray casting, even-odd rule. Points exactly on an edge may fall on
  // either side.
  bool contains(const Coordinates& c) const;
};

using Area = std::variant<Rectangle, Circle, Polygon>;

bool area_contains(const Area& area, const Coordinates& c);

// Throws InputException on degenerate shapes.
void check_area(const Area& area);

} // namespace canvass

#endif
