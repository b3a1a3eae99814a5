/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <gtest/gtest.h>

#include "test_utils.h"
#include "utils/exception.h"
#include "utils/input_parser.h"
#include "utils/output_json.h"

namespace canvass::io {
namespace {

TEST(InputParserTest, ParsesStops) {
  const auto stops = parse_stops(R"([
    {"id": "p1", "latitude": 29.42, "longitude": -98.49,
     "address": "100 Main St", "city": "San Antonio", "zip": "78205"},
    {"id": 42, "lat": 29.43, "lon": -98.48, "visited": true,
     "visitedBy": "Raul", "visitedAt": "2026-01-02T03:04:05.000Z"},
    {"id": "p3", "latitude": null, "longitude": null},
    {"id": "p4", "latitude": 0, "longitude": 0}
  ])");

  ASSERT_EQ(stops.size(), 4u);
  EXPECT_EQ(stops[0].id, "p1");
  EXPECT_EQ(stops[0].coordinates.value(), (Coordinates{29.42, -98.49}));
  EXPECT_EQ(stops[0].full_address(), "100 Main St, San Antonio, 78205");
  EXPECT_FALSE(stops[0].visited);

  EXPECT_EQ(stops[1].id, "42");
  EXPECT_TRUE(stops[1].visited);
  EXPECT_EQ(stops[1].visited_by.value(), "Raul");

  EXPECT_FALSE(stops[2].has_coordinates());
  EXPECT_FALSE(stops[3].has_coordinates());
}

TEST(InputParserTest, ParsesWrappedStops) {
  const auto stops =
    parse_stops(R"({"stops": [{"id": "a", "latitude": 1, "longitude": 2}]})");
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_EQ(stops[0].id, "a");
}

TEST(InputParserTest, RejectsInvalidStops) {
  EXPECT_THROW(parse_stops("not json"), InputException);
  EXPECT_THROW(parse_stops(R"([{"latitude": 1, "longitude": 2}])"),
               InputException);
  EXPECT_THROW(parse_stops(R"([{"id": "a", "latitude": "north"}])"),
               InputException);
  EXPECT_THROW(parse_stops(R"({"records": []})"), InputException);
}

TEST(InputParserTest, ParsesAreas) {
  const auto rectangle = parse_area(std::string(
    R"({"type": "rectangle",
        "bounds": {"north": 29.5, "south": 29.4, "east": -98.4,
                   "west": -98.6}})"));
  ASSERT_TRUE(std::holds_alternative<Rectangle>(rectangle));
  EXPECT_EQ(std::get<Rectangle>(rectangle).north, 29.5);

  const auto circle = parse_area(std::string(
    R"({"type": "circle", "center": {"lat": 29.4, "lng": -98.5},
        "radius": 250})"));
  ASSERT_TRUE(std::holds_alternative<Circle>(circle));
  EXPECT_EQ(std::get<Circle>(circle).radius, 250);
  EXPECT_EQ(std::get<Circle>(circle).center, (Coordinates{29.4, -98.5}));

  const auto polygon = parse_area(std::string(
    R"({"type": "polygon", "polygon": [{"lat": 0, "lng": 0},
        {"lat": 0, "lng": 1}, [1, 1]]})"));
  ASSERT_TRUE(std::holds_alternative<Polygon>(polygon));
  EXPECT_EQ(std::get<Polygon>(polygon).vertices.size(), 3u);
}

TEST(InputParserTest, RejectsInvalidAreas) {
  EXPECT_THROW(parse_area(std::string(R"({"type": "hexagon"})")),
               InputException);
  EXPECT_THROW(parse_area(std::string(
                 R"({"type": "circle", "center": {"lat": 1, "lng": 1},
                     "radius": -5})")),
               InputException);
  EXPECT_THROW(parse_area(std::string(
                 R"({"type": "polygon", "polygon": [[0, 0], [1, 1]]})")),
               InputException);
}

TEST(InputParserTest, ConfigOverridesDefaults) {
  CLArgs args;
  parse_config(R"({"solver": {"host": "solver.local", "port": 9000,
                              "timeout_ms": 5000},
                   "drivers": ["Ana"], "log_level": "debug"})",
               args);

  EXPECT_EQ(args.solver.host, "solver.local");
  EXPECT_EQ(args.solver.port, "9000");
  EXPECT_EQ(args.solver.path, DEFAULT_SOLVER_PATH);
  EXPECT_EQ(args.solver_timeout_ms, 5000u);
  EXPECT_EQ(args.drivers, std::vector<std::string>{"Ana"});
  EXPECT_EQ(args.log_level, "debug");
  EXPECT_FALSE(args.store_path.has_value());

  EXPECT_THROW(parse_config(R"({"drivers": []})", args), InputException);
  EXPECT_THROW(parse_config(R"({"solver": "localhost"})", args),
               InputException);
}

TEST(InputParserTest, ParsesSolverResponse) {
  const auto response = parse_solver_response(R"({
    "success": true,
    "routes": [{
      "waypoints": [
        {"id": "depot", "lat": 29.4, "lon": -98.5, "address": "Start",
         "originalId": "d", "isDepot": true},
        {"id": "a", "lat": 29.41, "lon": -98.5, "address": "1 A St"}
      ],
      "cost": 12,
      "distance": 1.2
    }],
    "totalDistance": 1.2
  })");

  EXPECT_TRUE(response.success);
  ASSERT_EQ(response.routes.size(), 1u);
  const auto& waypoints = response.routes[0].waypoints;
  ASSERT_EQ(waypoints.size(), 2u);
  EXPECT_EQ(waypoints[0].original_id.value(), "d");
  EXPECT_TRUE(waypoints[0].is_depot);
  EXPECT_FALSE(waypoints[1].original_id.has_value());
  EXPECT_EQ(response.total_distance, 1.2);
}

TEST(InputParserTest, SolverFailureAndGarbage) {
  const auto failure =
    parse_solver_response(R"({"success": false, "error": "No route"})");
  EXPECT_FALSE(failure.success);
  EXPECT_EQ(failure.error, "No route");
  EXPECT_TRUE(failure.routes.empty());

  EXPECT_THROW(parse_solver_response("<html>"), SolverException);
  EXPECT_THROW(parse_solver_response(R"({"success": true, "routes": 3})"),
               SolverException);
  EXPECT_THROW(parse_solver_response(
                 R"({"success": true, "routes": [{"distance": 1}]})"),
               SolverException);
}

TEST(InputParserTest, SnapshotSurvivesWriteAndRead) {
  StoreSnapshot snapshot;
  snapshot.next_route = 3;
  snapshot.next_route_stop = 8;
  snapshot.stops = {test::make_stop("a", 29.41, -98.5),
                    Stop("b", std::nullopt, "2 B St")};

  Route route;
  route.id = "route-2";
  route.driver = "Raul";
  route.type = ROUTE_TYPE::PROPERTY;
  route.status = ROUTE_STATUS::FINISHED;
  route.created_at = "2026-01-01T00:00:00.000Z";
  route.finished_at = "2026-01-01T05:00:00.000Z";
  route.version = 4;
  route.stops = {{"rs-6", "a", 0, true}, {"rs-7", "b", 1, false}};
  route.route_data.depot_pin = Coordinates{29.41, -98.5};
  route.route_data.routes.push_back(
    {{{"a", {29.41, -98.5}, "1 A St", 0, true, 0},
      {"b", {29.42, -98.5}, "2 B St", 1, false, 1.1}},
     1.1});
  route.route_data.total_distance = 1.1;
  snapshot.routes.push_back(route);

  const auto parsed = parse_snapshot(to_json(snapshot).dump());

  EXPECT_EQ(parsed.next_route, 3u);
  EXPECT_EQ(parsed.next_route_stop, 8u);
  ASSERT_EQ(parsed.stops.size(), 2u);
  EXPECT_FALSE(parsed.stops[1].has_coordinates());
  ASSERT_EQ(parsed.routes.size(), 1u);

  const auto& r = parsed.routes[0];
  EXPECT_EQ(r.status, ROUTE_STATUS::FINISHED);
  EXPECT_EQ(r.type, ROUTE_TYPE::PROPERTY);
  EXPECT_EQ(r.finished_at, route.finished_at);
  EXPECT_EQ(r.version, 4u);
  EXPECT_EQ(r.stops, route.stops);
  EXPECT_EQ(test::waypoint_ids(r.route_data),
            (std::vector<Id>{"a", "b"}));
  EXPECT_EQ(r.route_data.depot_pin, route.route_data.depot_pin);
  EXPECT_DOUBLE_EQ(r.route_data.routes[0].waypoints[1].leg_distance, 1.1);
}

TEST(OutputJsonTest, ErrorsCarryCode) {
  const auto error = to_json(NoEligibleCandidatesException("Nothing left."));
  EXPECT_EQ(error["code"], 4);
  EXPECT_EQ(error["error"], "Nothing left.");

  const auto conflict = to_json(
    DepotConflictException(DEPOT_CONFLICT::ALREADY_ROUTED, "a", "route-1"));
  EXPECT_EQ(conflict["code"], 5);
  EXPECT_EQ(conflict["reason"], "already_routed");
  EXPECT_EQ(conflict["routeId"], "route-1");
}

TEST(OutputJsonTest, SolverRequestWireFormat) {
  routing::SolverRequest request;
  request.stops = {{"a", {29.41, -98.5}, "1 A St"}};
  request.vehicle_count = 2;
  request.depot_pin = Coordinates{29.4, -98.49};
  request.depot_id = "a";

  const auto json = to_json(request);

  EXPECT_EQ(json["numVehicles"], 2);
  EXPECT_EQ(json["depotLat"], 29.4);
  EXPECT_EQ(json["depotLon"], -98.49);
  EXPECT_EQ(json["depotPropertyId"], "a");
  ASSERT_EQ(json["properties"].size(), 1u);
  EXPECT_EQ(json["properties"][0]["latitude"], 29.41);
  EXPECT_EQ(json["properties"][0]["address"], "1 A St");
}

} // namespace
} // namespace canvass::io
