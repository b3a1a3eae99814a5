/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <filesystem>
#include <thread>

#include <gtest/gtest.h>

#include "store/route_store.h"
#include "test_utils.h"
#include "utils/exception.h"

namespace canvass {
namespace {

using test::line_of_stops;
using test::make_stop;
using test::waypoint_ids;

const std::vector<std::string> DRIVERS{"Luciano", "Raul"};

class RouteStoreTest : public ::testing::Test {
protected:
  RouteStore store{DRIVERS};

  void SetUp() override {
    store.upsert_stops(line_of_stops(10));
  }

  Route create(const std::vector<Id>& ids,
               const std::string& driver = "Raul") {
    return store.create_route(driver, ROUTE_TYPE::PREFORECLOSURE, ids, {});
  }
};

TEST_F(RouteStoreTest, CreateRouteAssignsDenseRows) {
  const auto route = create({"s3", "s1", "s2"});

  EXPECT_EQ(route.id, "route-1");
  EXPECT_EQ(route.version, 1u);
  EXPECT_TRUE(route.is_active());
  EXPECT_FALSE(route.created_at.empty());
  ASSERT_EQ(route.size(), 3u);
  EXPECT_EQ(route.ordered_stop_ids(), (std::vector<Id>{"s3", "s1", "s2"}));
  EXPECT_TRUE(route.stops[0].is_depot);
  EXPECT_FALSE(route.stops[1].is_depot);
  EXPECT_EQ(route.stops[2].order_index, 2u);
  // Geometry derived from the rows when none is given.
  EXPECT_EQ(waypoint_ids(route.route_data),
            (std::vector<Id>{"s3", "s1", "s2"}));

  const auto second = create({"s4", "s5"});
  EXPECT_EQ(second.id, "route-2");
  EXPECT_NE(second.stops[0].id, route.stops[0].id);
}

TEST_F(RouteStoreTest, CreateRouteValidatesInput) {
  EXPECT_THROW(create({"s1", "s2"}, "Nobody"), InputException);
  EXPECT_THROW(create({}), InputException);
  EXPECT_THROW(create({"s1"}), DepotOnlyCandidateSetException);
  EXPECT_THROW(create({"s1", "unknown"}), InputException);
  EXPECT_THROW(create({"s1", "s2", "s1"}), InputException);
  EXPECT_TRUE(store.get_routes().empty());
}

TEST_F(RouteStoreTest, DepotExclusivityAcrossActiveRoutes) {
  create({"s1", "s2", "s3"});

  try {
    create({"s1", "s4"});
    FAIL() << "Expected DepotConflictException";
  } catch (const DepotConflictException& e) {
    EXPECT_EQ(e.reason, DEPOT_CONFLICT::ALREADY_DEPOT);
    EXPECT_EQ(e.route_id, "route-1");
  }

  try {
    create({"s2", "s4"});
    FAIL() << "Expected DepotConflictException";
  } catch (const DepotConflictException& e) {
    EXPECT_EQ(e.reason, DEPOT_CONFLICT::ALREADY_ROUTED);
  }

  // The depot of route-1 can't be visited by another route either.
  EXPECT_THROW(create({"s4", "s1"}), DepotConflictException);
  EXPECT_EQ(store.get_active_routes().size(), 1u);

  store.finish_route("route-1");
  EXPECT_NO_THROW(create({"s1", "s4"}));
}

TEST_F(RouteStoreTest, LifecycleTransitions) {
  create({"s1", "s2"});
  create({"s3", "s4"});
  create({"s5", "s6"});

  const auto finished = store.finish_route("route-1");
  EXPECT_EQ(finished.status, ROUTE_STATUS::FINISHED);
  EXPECT_TRUE(finished.finished_at.has_value());
  EXPECT_EQ(finished.size(), 2u);
  EXPECT_EQ(finished.version, 2u);

  const auto cancelled = store.cancel_route("route-2");
  EXPECT_EQ(cancelled.status, ROUTE_STATUS::CANCELLED);
  EXPECT_EQ(cancelled.size(), 2u);

  const auto deleted = store.delete_route("route-3");
  EXPECT_EQ(deleted.status, ROUTE_STATUS::CANCELLED);
  EXPECT_TRUE(deleted.empty());
  EXPECT_TRUE(deleted.route_data.empty());

  EXPECT_THROW(store.finish_route("route-2"), InputException);
  EXPECT_THROW(store.cancel_route("route-1"), InputException);
  EXPECT_THROW(store.finish_route("route-9"), NotFoundException);

  EXPECT_TRUE(store.get_active_routes().empty());
  EXPECT_EQ(store.get_routes(ROUTE_STATUS::CANCELLED).size(), 2u);
  EXPECT_TRUE(store.routed_index().routed_ids().empty());

  // Stops survive route termination.
  EXPECT_EQ(store.stops().size(), 10u);
}

TEST_F(RouteStoreTest, VisitedStateLivesOnStops) {
  const auto before = create({"s1", "s2", "s3"});

  const auto visited = store.set_visited("s2", "Luciano", true);
  EXPECT_TRUE(visited.visited);
  EXPECT_EQ(visited.visited_by.value(), "Luciano");
  EXPECT_TRUE(visited.visited_at.has_value());

  const auto after = store.get_route(before.id);
  EXPECT_EQ(after.stops, before.stops);
  EXPECT_EQ(after.version, before.version);

  const auto unvisited = store.set_visited("s2", std::nullopt, false);
  EXPECT_FALSE(unvisited.visited);
  EXPECT_FALSE(unvisited.visited_by.has_value());
  EXPECT_FALSE(unvisited.visited_at.has_value());

  EXPECT_THROW(store.set_visited("s2", "Nobody", true), InputException);
  EXPECT_THROW(store.set_visited("unknown", "Raul", true), NotFoundException);
}

TEST_F(RouteStoreTest, UpdateChecksVersion) {
  const auto route = create({"s1", "s2", "s3"});

  const auto updated = store.update(
    route.id,
    [](Route& r, const utils::StopLookup&) {
      r.move(2, 1);
      return true;
    },
    1);
  EXPECT_EQ(updated.version, 2u);
  EXPECT_EQ(updated.ordered_stop_ids(), (std::vector<Id>{"s1", "s3", "s2"}));

  EXPECT_THROW(store.update(
                 route.id,
                 [](Route&, const utils::StopLookup&) { return true; },
                 1),
               ConflictException);

  const auto unchanged = store.update(
    route.id,
    [](Route&, const utils::StopLookup&) { return false; });
  EXPECT_EQ(unchanged.version, 2u);

  // Failed mutations leave the route alone.
  EXPECT_THROW(store.update(route.id,
                            [](Route& r, const utils::StopLookup&) -> bool {
                              r.stops.clear();
                              throw InputException("nope");
                            }),
               InputException);
  EXPECT_EQ(store.get_route(route.id).size(), 3u);
}

TEST_F(RouteStoreTest, ConcurrentEditsAreSerialized) {
  const auto route = create({"s1", "s2", "s3", "s4", "s5", "s6"});
  constexpr unsigned edits_per_thread = 50;

  std::vector<std::thread> threads;
  for (unsigned t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (unsigned i = 0; i < edits_per_thread; ++i) {
        store.update(route.id, [&](Route& r, const utils::StopLookup&) {
          r.move(1 + (i + t) % 5, 1 + (i * 3 + t) % 5);
          return true;
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto final_route = store.get_route(route.id);
  EXPECT_EQ(final_route.version, 1u + 4 * edits_per_thread);
  EXPECT_EQ(final_route.size(), 6u);
  EXPECT_EQ(final_route.stops[0].stop_id, "s1");
  for (Index i = 0; i < final_route.size(); ++i) {
    EXPECT_EQ(final_route.stops[i].order_index, i);
  }
}

class RouteStorePersistenceTest : public ::testing::Test {
protected:
  std::filesystem::path path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = std::filesystem::temp_directory_path() /
           fmt::format("canvass_store_{}_{}.json",
                       info->name(),
                       ::testing::UnitTest::GetInstance()->random_seed());
    remove_files();
  }

  void TearDown() override {
    remove_files();
  }

  void remove_files() {
    auto lock_path = path;
    lock_path += ".lock";
    std::filesystem::remove(path);
    std::filesystem::remove(lock_path);
  }

  static bool drop_last_stop(Route& r, const utils::StopLookup&) {
    r.remove(r.size() - 1);
    return true;
  }
};

TEST_F(RouteStorePersistenceTest, SnapshotIsReloaded) {
  {
    RouteStore store(DRIVERS, path);
    store.upsert_stops(line_of_stops(5));
    store.create_route("Raul", ROUTE_TYPE::PROPERTY, {"s1", "s2", "s3"}, {});
    store.set_visited("s4", "Raul", true);
  }

  {
    RouteStore store(DRIVERS, path);
    EXPECT_EQ(store.stops().size(), 5u);
    EXPECT_TRUE(store.stop("s4").value().visited);

    const auto routes = store.get_active_routes();
    ASSERT_EQ(routes.size(), 1u);
    EXPECT_EQ(routes[0].type, ROUTE_TYPE::PROPERTY);
    EXPECT_EQ(routes[0].ordered_stop_ids(),
              (std::vector<Id>{"s1", "s2", "s3"}));

    // Id counters survive as well.
    const auto next =
      store.create_route("Raul", ROUTE_TYPE::PROPERTY, {"s4", "s5"}, {});
    EXPECT_EQ(next.id, "route-2");
  }
}

TEST_F(RouteStorePersistenceTest, SessionsKeepEditsToDifferentRoutes) {
  {
    RouteStore setup(DRIVERS, path);
    setup.upsert_stops(line_of_stops(8));
    setup.create_route("Raul",
                       ROUTE_TYPE::PROPERTY,
                       {"s1", "s2", "s3", "s4"},
                       {});
    setup.create_route("Luciano",
                       ROUTE_TYPE::PROPERTY,
                       {"s5", "s6", "s7", "s8"},
                       {});
  }

  // Both sessions are opened before either one writes.
  RouteStore first(DRIVERS, path);
  RouteStore second(DRIVERS, path);

  first.update("route-1", drop_last_stop);
  second.update("route-2", drop_last_stop);

  RouteStore check(DRIVERS, path);
  EXPECT_EQ(check.get_route("route-1").size(), 3u);
  EXPECT_EQ(check.get_route("route-2").size(), 3u);
  EXPECT_EQ(check.get_route("route-1").version, 2u);
  EXPECT_EQ(check.get_route("route-2").version, 2u);
}

TEST_F(RouteStorePersistenceTest, StaleVersionFromAnotherSessionConflicts) {
  {
    RouteStore setup(DRIVERS, path);
    setup.upsert_stops(line_of_stops(5));
    setup.create_route("Raul",
                       ROUTE_TYPE::PROPERTY,
                       {"s1", "s2", "s3", "s4"},
                       {});
  }

  RouteStore first(DRIVERS, path);
  RouteStore second(DRIVERS, path);
  const auto seen = second.get_route("route-1").version;

  first.update("route-1", drop_last_stop, seen);

  EXPECT_THROW(second.update(
                 "route-1",
                 [](Route& r, const utils::StopLookup&) {
                   r.move(2, 1);
                   return true;
                 },
                 seen),
               ConflictException);

  const auto route = second.get_route("route-1");
  EXPECT_EQ(route.version, seen + 1);
  EXPECT_EQ(route.ordered_stop_ids(), (std::vector<Id>{"s1", "s2", "s3"}));
}

TEST_F(RouteStorePersistenceTest, FailedWriteLeavesStateUntouched) {
  RouteStore store(DRIVERS, path);
  store.upsert_stops(line_of_stops(3));
  store.create_route("Raul", ROUTE_TYPE::PROPERTY, {"s1", "s2"}, {});

  // Not valid UTF-8, the snapshot can't be serialized.
  auto bad = make_stop("x", 29.5, -98.5);
  bad.address = "12 Main St \xff";

  EXPECT_THROW(store.upsert_stops({bad}), InternalException);
  EXPECT_FALSE(store.stop("x").has_value());
  EXPECT_EQ(store.stops().size(), 3u);

  RouteStore reopened(DRIVERS, path);
  EXPECT_FALSE(reopened.stop("x").has_value());
  EXPECT_EQ(reopened.get_routes().size(), 1u);
}

} // namespace
} // namespace canvass
