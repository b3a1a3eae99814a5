#ifndef ROUTE_STORE_H
#define ROUTE_STORE_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/interprocess/sync/file_lock.hpp>

#include "structures/canvass/store_snapshot.h"
#include "utils/projection.h"

namespace canvass {

// Route and stop rows with an optional JSON snapshot file.
//
// Writes are serialized within the process and, when a snapshot file
// is set, across processes by a lock on a sidecar ".lock" file. Every
// write reloads the snapshot under that lock, applies the change to a
// copy of the state, persists the copy and only then publishes it.
class RouteStore {
public:
  // Apply an edit to a copy of the route. Returns false if nothing
  // changed.
  using Mutator = std::function<bool(Route&, const utils::StopLookup&)>;

private:
  struct State {
    IdMap<Stop> stops;
    std::vector<Id> stop_order;
    IdMap<Route> routes;
    std::vector<Id> route_order;
    uint64_t next_route{1};
    uint64_t next_route_stop{1};

    std::optional<Stop> find_stop(std::string_view stop_id) const;
  };

  class WriteGuard;

  const std::vector<std::string> _drivers;
  const std::optional<std::filesystem::path> _snapshot_path;

  std::mutex _write_mutex;
  std::unique_ptr<boost::interprocess::file_lock> _file_lock;

  // Guards _state, writers also hold a WriteGuard.
  mutable std::shared_mutex _mutex;
  State _state;

  static void check_depot_exclusivity(const State& state, const Route& route);

  // Callers hold a WriteGuard.
  void reload();
  void persist(const State& state) const;

  // Reload, run change on a copy of the state, then persist and publish
  // the copy if change returns true.
  void transact(const std::function<bool(State&)>& change);

  Route commit(std::string_view route_id,
               const std::function<bool(Route&, const State&)>& change,
               std::optional<Version> expected_version,
               bool require_active);

public:
  explicit RouteStore(
    std::vector<std::string> drivers,
    std::optional<std::filesystem::path> snapshot_path = std::nullopt);

  const std::vector<std::string>& drivers() const {
    return _drivers;
  }

  // Throws InputException if driver is not in the roster.
  void check_driver(std::string_view driver) const;

  // Lead records, replaced by id.
  void upsert_stops(const std::vector<Stop>& stops);

  std::optional<Stop> stop(std::string_view stop_id) const;

  // In insertion order.
  std::vector<Stop> stops() const;

  utils::StopLookup lookup() const;

  // Create an ACTIVE route visiting ordered_stop_ids, the first one
  // being the depot. All or nothing.
  Route create_route(const std::string& driver,
                     ROUTE_TYPE type,
                     const std::vector<Id>& ordered_stop_ids,
                     RouteData route_data);

  std::vector<Route> get_active_routes() const;

  // In creation order, all routes if no status is given.
  std::vector<Route>
  get_routes(std::optional<ROUTE_STATUS> status = std::nullopt) const;

  // Throws NotFoundException.
  Route get_route(std::string_view route_id) const;

  utils::RoutedIndex routed_index() const;

  // Cancel the route and detach its rows and geometry.
  Route delete_route(std::string_view route_id,
                     std::optional<Version> expected_version = std::nullopt);

  Route finish_route(std::string_view route_id,
                     std::optional<Version> expected_version = std::nullopt);

  Route cancel_route(std::string_view route_id,
                     std::optional<Version> expected_version = std::nullopt);

  // Visited state lives on the stop, route rows are left alone.
  Stop set_visited(std::string_view stop_id,
                   const std::optional<std::string>& driver,
                   bool visited);

  // Run mutator on a copy of an ACTIVE route and commit the result with
  // a version bump. Throws ConflictException if expected_version is
  // stale.
  Route update(std::string_view route_id,
               const Mutator& mutator,
               std::optional<Version> expected_version = std::nullopt);
};

} // namespace canvass

#endif
