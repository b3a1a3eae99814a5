/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "structures/canvass/coordinates.h"

#include <cmath>
#include <numbers>

namespace canvass {

namespace {

constexpr double to_radians(double degrees) {
  return degrees * std::numbers::pi / 180;
}

} // namespace

Distance Coordinates::distance_to(const Coordinates& other) const {
  const double d_lat = to_radians(other.lat - lat);
  const double d_lon = to_radians(other.lon - lon);

  const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                   std::cos(to_radians(lat)) * std::cos(to_radians(other.lat)) *
                     std::sin(d_lon / 2) * std::sin(d_lon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

  return EARTH_RADIUS_KM * c;
}

bool valid_coordinates(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) && -90 <= lat && lat <= 90 &&
         -180 <= lon && lon <= 180;
}

} // namespace canvass
