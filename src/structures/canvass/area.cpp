/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/area.h"

#include "utils/exception.h"

namespace canvass {

bool Rectangle::contains(const Coordinates& c) const {
  return south <= c.lat && c.lat <= north && west <= c.lon && c.lon <= east;
}

bool Circle::contains(const Coordinates& c) const {
  return center.distance_to(c) * 1000 <= radius;
}

bool Polygon::contains(const Coordinates& c) const {
  bool inside = false;

  for (std::size_t i = 0, j = vertices.size() - 1; i < vertices.size();
       j = i++) {
    const auto& vi = vertices[i];
    const auto& vj = vertices[j];

    // Edge (vj, vi) straddles the horizontal line through c.
    if ((vi.lat > c.lat) != (vj.lat > c.lat)) {
      const double lon_at_lat =
        vi.lon + (c.lat - vi.lat) * (vj.lon - vi.lon) / (vj.lat - vi.lat);
      if (c.lon < lon_at_lat) {
        inside = !inside;
      }
    }
  }

  return inside;
}

bool area_contains(const Area& area, const Coordinates& c) {
  return std::visit([&](const auto& shape) { return shape.contains(c); },
                    area);
}

void check_area(const Area& area) {
  if (const auto* r = std::get_if<Rectangle>(&area); r != nullptr) {
    if (r->south > r->north || r->west > r->east) {
      throw InputException("Invalid rectangle bounds.");
    }
  } else if (const auto* ci = std::get_if<Circle>(&area); ci != nullptr) {
    if (!(ci->radius > 0) ||
        !valid_coordinates(ci->center.lat, ci->center.lon)) {
      throw InputException("Invalid circle.");
    }
  } else if (const auto* p = std::get_if<Polygon>(&area); p != nullptr) {
    if (p->vertices.size() < 3) {
      throw InputException("A polygon needs at least 3 vertices.");
    }
  }
}

} // namespace canvass
