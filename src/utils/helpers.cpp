/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/helpers.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace canvass::utils {

std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
  const auto millis =
    std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds);

  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z",
                     fmt::gmtime(std::chrono::system_clock::to_time_t(now)),
                     millis.count());
}

std::string normalize_address(std::string_view address) {
  std::string normalized;
  normalized.reserve(address.size());

  bool pending_space = false;
  for (const char ch : address) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c)) {
      if (pending_space && !normalized.empty()) {
        normalized += ' ';
      }
      pending_space = false;
      normalized += static_cast<char>(std::tolower(c));
    } else {
      pending_space = true;
    }
  }

  return normalized;
}

bool address_matches(std::string_view waypoint_address, const Stop& stop) {
  const auto w = normalize_address(waypoint_address);
  const auto s = normalize_address(stop.address);
  if (w.empty() || s.empty() || !w.starts_with(s)) {
    return false;
  }
  return w.size() == s.size() || w[s.size()] == ' ';
}

void check_driver(const std::vector<std::string>& drivers,
                  std::string_view driver) {
  if (std::ranges::none_of(drivers,
                           [&](const auto& d) { return d == driver; })) {
    throw InputException(
      fmt::format("Unknown driver \"{}\", expected one of: {}.",
                  driver,
                  fmt::join(drivers, ", ")));
  }
}

std::optional<Index> closest_stop(const std::vector<Stop>& stops,
                                  const Coordinates& c) {
  std::optional<Index> best;
  Distance best_distance = std::numeric_limits<Distance>::max();

  for (Index i = 0; i < stops.size(); ++i) {
    if (!stops[i].has_coordinates()) {
      continue;
    }
    const auto d = c.distance_to(stops[i].coordinates.value());
    if (d < best_distance) {
      best_distance = d;
      best = i;
    }
  }

  return best;
}

std::string directions_url(const VehicleRoute& route) {
  if (route.waypoints.empty()) {
    throw InputException("No waypoints to export.");
  }

  const auto count =
    std::min(route.waypoints.size(), MAX_DIRECTIONS_WAYPOINTS);

  std::string url = "https://www.google.com/maps/dir";
  for (std::size_t i = 0; i < count; ++i) {
    const auto& c = route.waypoints[i].coordinates;
    url += fmt::format("/{},{}", c.lat, c.lon);
  }

  return url;
}

} // namespace canvass::utils
