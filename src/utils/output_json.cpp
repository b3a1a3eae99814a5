/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/output_json.h"

#include <fstream>
#include <iostream>

#include <fmt/format.h>

using json = nlohmann::json;

namespace canvass::io {

namespace {

json waypoint_to_json(const Waypoint& w) {
  return {{"id", w.id},
          {"lat", w.coordinates.lat},
          {"lon", w.coordinates.lon},
          {"address", w.address},
          {"order", w.order},
          {"isDepot", w.is_depot},
          {"legDistance", w.leg_distance}};
}

json optional_string(const std::optional<std::string>& s) {
  return s.has_value() ? json(s.value()) : json(nullptr);
}

json route_header(const Route& route) {
  return {{"id", route.id},
          {"driver", route.driver},
          {"status", to_string(route.status)},
          {"routeType", to_string(route.type)},
          {"createdAt", route.created_at},
          {"finishedAt", optional_string(route.finished_at)},
          {"version", route.version},
          {"recordCount", route.size()},
          {"routeData", to_json(route.route_data)}};
}

json route_stop_to_json(const RouteStop& rs) {
  return {{"id", rs.id},
          {"stopId", rs.stop_id},
          {"orderIndex", rs.order_index},
          {"isDepot", rs.is_depot}};
}

} // namespace

json to_json(const Stop& stop) {
  json j = {{"id", stop.id},
            {"latitude", nullptr},
            {"longitude", nullptr},
            {"address", stop.address},
            {"city", stop.city},
            {"zip", stop.zip},
            {"visited", stop.visited},
            {"visitedBy", optional_string(stop.visited_by)},
            {"visitedAt", optional_string(stop.visited_at)}};
  if (stop.has_coordinates()) {
    j["latitude"] = stop.coordinates.value().lat;
    j["longitude"] = stop.coordinates.value().lon;
  }
  return j;
}

json to_json(const RouteData& data) {
  if (data.empty()) {
    return nullptr;
  }

  json routes = json::array();
  for (const auto& route : data.routes) {
    json waypoints = json::array();
    for (const auto& w : route.waypoints) {
      waypoints.push_back(waypoint_to_json(w));
    }
    routes.push_back({{"distance", route.distance}, {"waypoints", waypoints}});
  }

  json j = {{"numVehicles", data.vehicle_count},
            {"totalDistance", data.total_distance},
            {"depot", nullptr},
            {"routes", routes}};
  if (data.depot_pin.has_value()) {
    j["depot"] = {{"lat", data.depot_pin.value().lat},
                  {"lon", data.depot_pin.value().lon},
                  {"address", data.depot_address}};
  }
  return j;
}

json to_json(const Route& route) {
  json j = route_header(route);
  json records = json::array();
  for (const auto& rs : route.stops) {
    records.push_back(route_stop_to_json(rs));
  }
  j["records"] = records;
  return j;
}

json to_json(const Route& route, const utils::StopLookup& lookup) {
  json j = route_header(route);
  json records = json::array();
  for (const auto& rs : route.stops) {
    json record = route_stop_to_json(rs);
    const auto stop = lookup(rs.stop_id);
    record["record"] = stop.has_value() ? to_json(stop.value()) : json(nullptr);
    records.push_back(record);
  }
  j["records"] = records;
  return j;
}

json to_json(const OptimizeResult& result, const utils::StopLookup& lookup) {
  json j = {{"success", true},
            {"route", to_json(result.route, lookup)},
            {"warning", nullptr}};
  if (result.warning.has_value()) {
    const auto& w = result.warning.value();
    j["warning"] = {{"type", "capacity"},
                    {"original", w.original},
                    {"final", w.final},
                    {"message",
                     fmt::format("Only {} of {} stops fit in the route.",
                                 w.final,
                                 w.original)}};
  }
  return j;
}

json to_json(const routing::SolverRequest& request) {
  json properties = json::array();
  for (const auto& stop : request.stops) {
    properties.push_back({{"id", stop.id},
                          {"latitude", stop.coordinates.lat},
                          {"longitude", stop.coordinates.lon},
                          {"address", stop.address}});
  }

  json j = {{"properties", properties},
            {"numVehicles", request.vehicle_count}};
  if (request.depot_pin.has_value()) {
    j["depotLat"] = request.depot_pin.value().lat;
    j["depotLon"] = request.depot_pin.value().lon;
  }
  if (request.depot_id.has_value()) {
    j["depotPropertyId"] = request.depot_id.value();
  }
  return j;
}

json to_json(const StoreSnapshot& snapshot) {
  json stops = json::array();
  for (const auto& stop : snapshot.stops) {
    stops.push_back(to_json(stop));
  }
  json routes = json::array();
  for (const auto& route : snapshot.routes) {
    routes.push_back(to_json(route));
  }

  return {{"nextRoute", snapshot.next_route},
          {"nextRouteStop", snapshot.next_route_stop},
          {"stops", stops},
          {"routes", routes}};
}

json to_json(const Exception& e) {
  json j = {{"code", e.error_code}, {"error", e.message}};
  if (const auto* conflict = dynamic_cast<const DepotConflictException*>(&e);
      conflict != nullptr) {
    j["reason"] = conflict->reason == DEPOT_CONFLICT::ALREADY_DEPOT
                    ? "already_depot"
                    : "already_routed";
    j["stopId"] = conflict->stop_id;
    j["routeId"] = conflict->route_id;
  }
  return j;
}

void write_to_output(const json& document,
                     const std::optional<std::filesystem::path>& output_file) {
  const std::string output = document.dump(2);

  if (!output_file.has_value()) {
    std::cout << output << std::endl;
    return;
  }

  std::ofstream out_stream(output_file.value(), std::ofstream::out);
  if (!out_stream) {
    throw InputException(
      fmt::format("Can't write to {}.", output_file.value().string()));
  }
  out_stream << output;
}

} // namespace canvass::io
