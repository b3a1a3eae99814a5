/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/input_parser.h"

#include <fmt/format.h>

#include "utils/exception.h"

using json = nlohmann::json;

namespace canvass::io {

namespace {

json parse_document(const std::string& input, std::string_view what) {
  json document = json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    throw InputException(fmt::format("Invalid JSON for {}.", what));
  }
  return document;
}

// Ids come as strings or as numbers from spreadsheet imports.
Id get_id(const json& object, const std::string& key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    throw InputException(fmt::format("Missing {}.", key));
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<int64_t>());
  }
  throw InputException(fmt::format("Invalid {}.", key));
}

double get_double(const json& object, const std::string& key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<double>();
}

std::optional<double> get_optional_double(const json& object,
                                          const std::string& key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<double>();
}

std::string get_string(const json& object,
                       const std::string& key,
                       std::string default_value = "") {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return default_value;
  }
  if (!it->is_string()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<std::string>();
}

std::optional<std::string> get_optional_string(const json& object,
                                               const std::string& key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<std::string>();
}

bool get_bool(const json& object, const std::string& key, bool default_value) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return default_value;
  }
  if (!it->is_boolean()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<bool>();
}

uint64_t get_unsigned(const json& object,
                      const std::string& key,
                      uint64_t default_value) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return default_value;
  }
  if (!it->is_number_unsigned()) {
    throw InputException(fmt::format("Invalid {} value.", key));
  }
  return it->get<uint64_t>();
}

const json& get_array(const json& object, const std::string& key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_array()) {
    throw InputException(fmt::format("Invalid {} array.", key));
  }
  return *it;
}

// Accepts {"lat", "lng"}, {"lat", "lon"} and [lat, lon].
Coordinates get_point(const json& point) {
  double lat;
  double lon;
  if (point.is_array() && point.size() == 2 && point[0].is_number() &&
      point[1].is_number()) {
    lat = point[0].get<double>();
    lon = point[1].get<double>();
  } else if (point.is_object()) {
    lat = get_double(point, "lat");
    lon = point.contains("lng") ? get_double(point, "lng")
                                : get_double(point, "lon");
  } else {
    throw InputException("Invalid point.");
  }
  if (!valid_coordinates(lat, lon)) {
    throw InputException(fmt::format("Invalid point ({}, {}).", lat, lon));
  }
  return {lat, lon};
}

std::optional<Coordinates> get_stop_coordinates(const json& object) {
  auto lat = get_optional_double(object, "latitude");
  if (!lat.has_value()) {
    lat = get_optional_double(object, "lat");
  }
  auto lon = get_optional_double(object, "longitude");
  if (!lon.has_value()) {
    lon = get_optional_double(object, "lon");
  }
  if (!lat.has_value() || !lon.has_value()) {
    return std::nullopt;
  }
  // Records geocoded as 0,0 or out of range are unusable.
  if (!valid_coordinates(lat.value(), lon.value()) ||
      (lat.value() == 0 && lon.value() == 0)) {
    return std::nullopt;
  }
  return Coordinates{lat.value(), lon.value()};
}

Waypoint parse_waypoint(const json& object) {
  Waypoint w;
  w.id = get_string(object, "id");
  w.coordinates = {get_double(object, "lat"), get_double(object, "lon")};
  w.address = get_string(object, "address");
  w.order = get_unsigned(object, "order", 0);
  w.is_depot = get_bool(object, "isDepot", false);
  w.leg_distance = get_optional_double(object, "legDistance").value_or(0);
  return w;
}

RouteStop parse_route_stop(const json& object) {
  if (!object.is_object()) {
    throw InputException("Invalid route stop.");
  }
  return {get_id(object, "id"),
          get_id(object, "stopId"),
          get_unsigned(object, "orderIndex", 0),
          get_bool(object, "isDepot", false)};
}

} // namespace

Stop parse_stop(const json& object) {
  if (!object.is_object()) {
    throw InputException("Invalid stop.");
  }

  Stop stop(get_id(object, "id"),
            get_stop_coordinates(object),
            get_string(object, "address"),
            get_bool(object, "visited", false));
  stop.city = get_string(object, "city");
  stop.zip = get_string(object, "zip");
  stop.visited_by = get_optional_string(object, "visitedBy");
  stop.visited_at = get_optional_string(object, "visitedAt");

  return stop;
}

std::vector<Stop> parse_stops(const std::string& input) {
  const json document = parse_document(input, "stops");
  const json& array =
    document.is_array() ? document : get_array(document, "stops");

  std::vector<Stop> stops;
  stops.reserve(array.size());
  for (const auto& object : array) {
    stops.push_back(parse_stop(object));
  }
  return stops;
}

Area parse_area(const json& object) {
  if (!object.is_object()) {
    throw InputException("Invalid area.");
  }
  const std::string type = get_string(object, "type");

  Area area;
  if (type == "rectangle") {
    const json& bounds =
      object.contains("bounds") ? object.at("bounds") : object;
    if (!bounds.is_object()) {
      throw InputException("Invalid area bounds.");
    }
    area = Rectangle{get_double(bounds, "north"),
                     get_double(bounds, "south"),
                     get_double(bounds, "east"),
                     get_double(bounds, "west")};
  } else if (type == "circle") {
    if (!object.contains("center")) {
      throw InputException("Missing circle center.");
    }
    area = Circle{get_point(object.at("center")), get_double(object, "radius")};
  } else if (type == "polygon") {
    Polygon polygon;
    for (const auto& point : get_array(object, "polygon")) {
      polygon.vertices.push_back(get_point(point));
    }
    area = std::move(polygon);
  } else {
    throw InputException(
      fmt::format("Invalid area type '{}', must be rectangle, circle or "
                  "polygon.",
                  type));
  }

  check_area(area);
  return area;
}

Area parse_area(const std::string& input) {
  return parse_area(parse_document(input, "area"));
}

void parse_config(const std::string& input, CLArgs& args) {
  const json document = parse_document(input, "config");
  if (!document.is_object()) {
    throw InputException("Invalid config.");
  }

  if (document.contains("solver")) {
    const json& solver = document.at("solver");
    if (!solver.is_object()) {
      throw InputException("Invalid solver config.");
    }
    args.solver.host = get_string(solver, "host", args.solver.host);
    if (solver.contains("port") && solver.at("port").is_number_unsigned()) {
      args.solver.port = std::to_string(solver.at("port").get<unsigned>());
    } else {
      args.solver.port = get_string(solver, "port", args.solver.port);
    }
    args.solver.path = get_string(solver, "path", args.solver.path);
    args.solver_timeout_ms = static_cast<unsigned>(
      get_unsigned(solver, "timeout_ms", args.solver_timeout_ms));
  }

  if (document.contains("store")) {
    const json& store = document.at("store");
    if (!store.is_object()) {
      throw InputException("Invalid store config.");
    }
    const auto path = get_optional_string(store, "path");
    if (path.has_value()) {
      args.store_path = path.value();
    }
  }

  if (document.contains("drivers")) {
    std::vector<std::string> drivers;
    for (const auto& driver : get_array(document, "drivers")) {
      if (!driver.is_string() || driver.get<std::string>().empty()) {
        throw InputException("Invalid driver name.");
      }
      drivers.push_back(driver.get<std::string>());
    }
    if (drivers.empty()) {
      throw InputException("Empty driver roster.");
    }
    args.drivers = std::move(drivers);
  }

  args.log_level = get_string(document, "log_level", args.log_level);
}

routing::SolverResponse parse_solver_response(const std::string& body) {
  const json document = json::parse(body, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw SolverException("Invalid JSON in solver response.");
  }

  routing::SolverResponse response;
  try {
    response.success = get_bool(document, "success", false);
    response.error = get_string(document, "error");
    if (!response.success) {
      return response;
    }

    const auto routes = document.find("routes");
    if (routes == document.end() || routes->is_null()) {
      return response;
    }
    if (!routes->is_array()) {
      throw InputException("Invalid routes array.");
    }

    for (const auto& r : *routes) {
      routing::SolverRoute route;
      route.distance = get_optional_double(r, "distance").value_or(0);
      for (const auto& w : get_array(r, "waypoints")) {
        routing::SolverWaypoint waypoint;
        waypoint.id = get_id(w, "id");
        if (w.contains("originalId") && !w.at("originalId").is_null()) {
          waypoint.original_id = get_id(w, "originalId");
        }
        const auto lat = get_optional_double(w, "lat");
        const auto lon = get_optional_double(w, "lon");
        if (lat.has_value() && lon.has_value() &&
            valid_coordinates(lat.value(), lon.value())) {
          waypoint.coordinates = Coordinates{lat.value(), lon.value()};
        }
        waypoint.address = get_string(w, "address");
        waypoint.is_depot = get_bool(w, "isDepot", false);
        route.waypoints.push_back(std::move(waypoint));
      }
      response.routes.push_back(std::move(route));
    }

    response.total_distance =
      get_optional_double(document, "totalDistance").value_or(0);
  } catch (const InputException& e) {
    throw SolverException(
      fmt::format("Invalid solver response: {}", e.message));
  }

  return response;
}

RouteData parse_route_data(const json& object) {
  RouteData data;
  if (object.is_null()) {
    return data;
  }
  if (!object.is_object()) {
    throw InputException("Invalid route data.");
  }

  data.vehicle_count =
    static_cast<unsigned>(get_unsigned(object, "numVehicles", 1));
  data.total_distance =
    get_optional_double(object, "totalDistance").value_or(0);
  if (object.contains("depot") && object.at("depot").is_object()) {
    const json& depot = object.at("depot");
    data.depot_pin = get_point(depot);
    data.depot_address = get_string(depot, "address");
  }
  if (object.contains("routes")) {
    for (const auto& r : get_array(object, "routes")) {
      VehicleRoute route;
      route.distance = get_optional_double(r, "distance").value_or(0);
      for (const auto& w : get_array(r, "waypoints")) {
        route.waypoints.push_back(parse_waypoint(w));
      }
      data.routes.push_back(std::move(route));
    }
  }

  return data;
}

Route parse_route(const json& object) {
  if (!object.is_object()) {
    throw InputException("Invalid route.");
  }

  Route route;
  route.id = get_id(object, "id");
  route.driver = get_string(object, "driver");
  route.status = get_route_status(get_string(object, "status", "ACTIVE"));
  route.type = get_route_type(get_string(object, "routeType", "PREFORECLOSURE"));
  route.created_at = get_string(object, "createdAt");
  route.finished_at = get_optional_string(object, "finishedAt");
  route.version = get_unsigned(object, "version", 1);
  if (object.contains("records")) {
    for (const auto& rs : get_array(object, "records")) {
      route.stops.push_back(parse_route_stop(rs));
    }
  }
  if (object.contains("routeData")) {
    route.route_data = parse_route_data(object.at("routeData"));
  }

  return route;
}

StoreSnapshot parse_snapshot(const std::string& input) {
  const json document = parse_document(input, "store snapshot");
  if (!document.is_object()) {
    throw InputException("Invalid store snapshot.");
  }

  StoreSnapshot snapshot;
  snapshot.next_route = get_unsigned(document, "nextRoute", 1);
  snapshot.next_route_stop = get_unsigned(document, "nextRouteStop", 1);
  if (document.contains("stops")) {
    for (const auto& stop : get_array(document, "stops")) {
      snapshot.stops.push_back(parse_stop(stop));
    }
  }
  if (document.contains("routes")) {
    for (const auto& route : get_array(document, "routes")) {
      snapshot.routes.push_back(parse_route(route));
    }
  }

  return snapshot;
}

} // namespace canvass::io
