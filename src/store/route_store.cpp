/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "store/route_store.h"

#include <fstream>
#include <sstream>

#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/exception.h"
#include "utils/helpers.h"
#include "utils/input_parser.h"
#include "utils/output_json.h"
#include "utils/route_repair.h"

namespace canvass {

// Exclusive write access to the store, in-process then inter-process.
class RouteStore::WriteGuard {
private:
  std::scoped_lock<std::mutex> _process_lock;
  std::optional<
    boost::interprocess::scoped_lock<boost::interprocess::file_lock>>
    _file_lock;

public:
  explicit WriteGuard(RouteStore& store) : _process_lock(store._write_mutex) {
    if (store._file_lock != nullptr) {
      try {
        _file_lock.emplace(*store._file_lock);
      } catch (const boost::interprocess::interprocess_exception& e) {
        throw InternalException(
          fmt::format("Can't lock store snapshot: {}.", e.what()));
      }
    }
  }
};

std::optional<Stop>
RouteStore::State::find_stop(std::string_view stop_id) const {
  const auto it = stops.find(stop_id);
  if (it == stops.end()) {
    return std::nullopt;
  }
  return it->second;
}

RouteStore::RouteStore(std::vector<std::string> drivers,
                       std::optional<std::filesystem::path> snapshot_path)
  : _drivers(std::move(drivers)), _snapshot_path(std::move(snapshot_path)) {
  if (_drivers.empty()) {
    throw InputException("Empty driver roster.");
  }

  if (_snapshot_path.has_value()) {
    auto lock_path = _snapshot_path.value();
    lock_path += ".lock";
    {
      // file_lock requires an existing file.
      std::ofstream touch(lock_path, std::ofstream::app);
      if (!touch) {
        throw InputException(
          fmt::format("Can't create lock file {}.", lock_path.string()));
      }
    }
    try {
      _file_lock =
        std::make_unique<boost::interprocess::file_lock>(lock_path.c_str());
    } catch (const boost::interprocess::interprocess_exception& e) {
      throw InputException(fmt::format("Can't open lock file {}: {}.",
                                       lock_path.string(),
                                       e.what()));
    }

    WriteGuard guard(*this);
    reload();
    spdlog::debug("Loaded {} stop(s) and {} route(s) from {}.",
                  _state.stops.size(),
                  _state.routes.size(),
                  _snapshot_path.value().string());
  }
}

void RouteStore::reload() {
  if (!_snapshot_path.has_value() ||
      !std::filesystem::exists(_snapshot_path.value())) {
    return;
  }

  std::ifstream in(_snapshot_path.value());
  if (!in) {
    throw InputException(fmt::format("Can't read store snapshot {}.",
                                     _snapshot_path.value().string()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto snapshot = io::parse_snapshot(buffer.str());

  State state;
  for (auto& s : snapshot.stops) {
    const Id id = s.id;
    if (state.stops.insert_or_assign(id, std::move(s)).second) {
      state.stop_order.push_back(id);
    }
  }
  for (auto& route : snapshot.routes) {
    const Id id = route.id;
    if (!state.routes.try_emplace(id, std::move(route)).second) {
      throw InputException(fmt::format("Duplicate route {} in snapshot.", id));
    }
    state.route_order.push_back(id);
  }
  state.next_route = snapshot.next_route;
  state.next_route_stop = snapshot.next_route_stop;

  std::unique_lock lock(_mutex);
  _state = std::move(state);
}

void RouteStore::persist(const State& state) const {
  if (!_snapshot_path.has_value()) {
    return;
  }

  StoreSnapshot snapshot;
  snapshot.next_route = state.next_route;
  snapshot.next_route_stop = state.next_route_stop;
  snapshot.stops.reserve(state.stop_order.size());
  for (const auto& id : state.stop_order) {
    snapshot.stops.push_back(state.stops.find(id)->second);
  }
  snapshot.routes.reserve(state.route_order.size());
  for (const auto& id : state.route_order) {
    snapshot.routes.push_back(state.routes.find(id)->second);
  }

  std::string content;
  try {
    content = io::to_json(snapshot).dump();
  } catch (const nlohmann::json::exception& e) {
    throw InternalException(
      fmt::format("Can't serialize store snapshot: {}", e.what()));
  }

  const auto& path = _snapshot_path.value();
  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ofstream::out | std::ofstream::trunc);
    out << content;
    if (!out) {
      throw InternalException(
        fmt::format("Can't write store snapshot {}.", tmp_path.string()));
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw InternalException(fmt::format("Can't replace store snapshot {}: {}.",
                                        path.string(),
                                        ec.message()));
  }
}

void RouteStore::transact(const std::function<bool(State&)>& change) {
  WriteGuard guard(*this);
  reload();

  State next;
  {
    std::shared_lock lock(_mutex);
    next = _state;
  }

  if (!change(next)) {
    return;
  }

  persist(next);

  std::unique_lock lock(_mutex);
  _state = std::move(next);
}

void RouteStore::check_driver(std::string_view driver) const {
  utils::check_driver(_drivers, driver);
}

void RouteStore::upsert_stops(const std::vector<Stop>& stops) {
  std::size_t known = 0;
  transact([&](State& state) {
    for (const auto& s : stops) {
      if (state.stops.insert_or_assign(s.id, s).second) {
        state.stop_order.push_back(s.id);
      }
    }
    known = state.stops.size();
    return true;
  });

  spdlog::info("Upserted {} stop(s), {} known.", stops.size(), known);
}

std::optional<Stop> RouteStore::stop(std::string_view stop_id) const {
  std::shared_lock lock(_mutex);
  return _state.find_stop(stop_id);
}

std::vector<Stop> RouteStore::stops() const {
  std::shared_lock lock(_mutex);
  std::vector<Stop> stops;
  stops.reserve(_state.stop_order.size());
  for (const auto& id : _state.stop_order) {
    stops.push_back(_state.stops.find(id)->second);
  }
  return stops;
}

utils::StopLookup RouteStore::lookup() const {
  return [this](std::string_view stop_id) { return stop(stop_id); };
}

void RouteStore::check_depot_exclusivity(const State& state,
                                         const Route& route) {
  std::vector<Route> others;
  for (const auto& [id, other] : state.routes) {
    if (id != route.id && other.is_active()) {
      others.push_back(other);
    }
  }
  const auto index = utils::index_routes(others);

  for (const auto& rs : route.stops) {
    if (const auto depot = index.depot_routes.find(rs.stop_id);
        depot != index.depot_routes.end()) {
      throw DepotConflictException(DEPOT_CONFLICT::ALREADY_DEPOT,
                                   rs.stop_id,
                                   depot->second);
    }
    if (!rs.is_depot) {
      continue;
    }
    if (const auto member = index.member_routes.find(rs.stop_id);
        member != index.member_routes.end()) {
      throw DepotConflictException(DEPOT_CONFLICT::ALREADY_ROUTED,
                                   rs.stop_id,
                                   member->second);
    }
  }
}

Route RouteStore::create_route(const std::string& driver,
                               ROUTE_TYPE type,
                               const std::vector<Id>& ordered_stop_ids,
                               RouteData route_data) {
  check_driver(driver);
  if (ordered_stop_ids.empty()) {
    throw InputException("A route needs at least one stop.");
  }
  if (ordered_stop_ids.size() == 1) {
    throw DepotOnlyCandidateSetException(
      "A route needs at least one stop besides the depot.");
  }

  Route route;
  transact([&](State& state) {
    route = Route();
    route.id = fmt::format("route-{}", state.next_route);
    route.driver = driver;
    route.type = type;
    route.status = ROUTE_STATUS::ACTIVE;
    route.route_data = route_data;

    IdSet seen;
    for (Index i = 0; i < ordered_stop_ids.size(); ++i) {
      const auto& stop_id = ordered_stop_ids[i];
      if (!state.stops.contains(stop_id)) {
        throw InputException(fmt::format("Unknown stop {}.", stop_id));
      }
      if (!seen.insert(stop_id).second) {
        throw InputException(fmt::format("Duplicate stop {}.", stop_id));
      }
      route.stops.push_back(
        {fmt::format("rs-{}", state.next_route_stop++), stop_id, i, i == 0});
    }

    // Geometry is projected on the rows before anything is stored.
    const auto report =
      utils::repair_route(route, [&state](std::string_view id) {
        return state.find_stop(id);
      });
    if (report.any()) {
      spdlog::warn("Route {} geometry repaired on creation: {}.",
                   route.id,
                   utils::describe(report));
    }

    check_depot_exclusivity(state, route);

    route.version = 1;
    route.created_at = utils::now_iso8601();

    state.routes.try_emplace(route.id, route);
    state.route_order.push_back(route.id);
    ++state.next_route;
    return true;
  });

  spdlog::info("Created route {} for {} with {} stop(s), depot {}.",
               route.id,
               route.driver,
               route.size(),
               route.stops.front().stop_id);

  return route;
}

std::vector<Route> RouteStore::get_active_routes() const {
  return get_routes(ROUTE_STATUS::ACTIVE);
}

std::vector<Route>
RouteStore::get_routes(std::optional<ROUTE_STATUS> status) const {
  std::shared_lock lock(_mutex);
  std::vector<Route> routes;
  for (const auto& id : _state.route_order) {
    const auto& route = _state.routes.find(id)->second;
    if (!status.has_value() || route.status == status.value()) {
      routes.push_back(route);
    }
  }
  return routes;
}

Route RouteStore::get_route(std::string_view route_id) const {
  std::shared_lock lock(_mutex);
  const auto it = _state.routes.find(route_id);
  if (it == _state.routes.end()) {
    throw NotFoundException(fmt::format("Unknown route {}.", route_id));
  }
  return it->second;
}

utils::RoutedIndex RouteStore::routed_index() const {
  return utils::index_routes(get_active_routes());
}

Route RouteStore::commit(
  std::string_view route_id,
  const std::function<bool(Route&, const State&)>& change,
  std::optional<Version> expected_version,
  bool require_active) {
  Route result;
  transact([&](State& state) {
    const auto it = state.routes.find(route_id);
    if (it == state.routes.end()) {
      throw NotFoundException(fmt::format("Unknown route {}.", route_id));
    }
    Route route = it->second;

    if (expected_version.has_value() &&
        expected_version.value() != route.version) {
      throw ConflictException(
        fmt::format("Route {} is at version {}, expected {}.",
                    route.id,
                    route.version,
                    expected_version.value()));
    }
    if (require_active && !route.is_active()) {
      throw InputException(
        fmt::format("Route {} is {}.", route.id, to_string(route.status)));
    }

    if (!change(route, state)) {
      result = std::move(route);
      return false;
    }

    if (route.is_active()) {
      check_depot_exclusivity(state, route);
    }
    ++route.version;
    it->second = route;
    result = std::move(route);
    return true;
  });

  return result;
}

Route RouteStore::delete_route(std::string_view route_id,
                               std::optional<Version> expected_version) {
  auto route = commit(
    route_id,
    [](Route& r, const State&) {
      if (r.status == ROUTE_STATUS::CANCELLED && r.empty() &&
          r.route_data.empty()) {
        return false;
      }
      r.status = ROUTE_STATUS::CANCELLED;
      if (!r.finished_at.has_value()) {
        r.finished_at = utils::now_iso8601();
      }
      r.stops.clear();
      r.route_data = RouteData();
      return true;
    },
    expected_version,
    false);

  spdlog::info("Deleted route {}.", route.id);
  return route;
}

Route RouteStore::finish_route(std::string_view route_id,
                               std::optional<Version> expected_version) {
  auto route = commit(
    route_id,
    [](Route& r, const State&) {
      r.status = ROUTE_STATUS::FINISHED;
      r.finished_at = utils::now_iso8601();
      return true;
    },
    expected_version,
    true);

  spdlog::info("Finished route {}.", route.id);
  return route;
}

Route RouteStore::cancel_route(std::string_view route_id,
                               std::optional<Version> expected_version) {
  auto route = commit(
    route_id,
    [](Route& r, const State&) {
      r.status = ROUTE_STATUS::CANCELLED;
      r.finished_at = utils::now_iso8601();
      return true;
    },
    expected_version,
    true);

  spdlog::info("Cancelled route {}.", route.id);
  return route;
}

Stop RouteStore::set_visited(std::string_view stop_id,
                             const std::optional<std::string>& driver,
                             bool visited) {
  if (visited && driver.has_value()) {
    check_driver(driver.value());
  }

  Stop result;
  transact([&](State& state) {
    const auto it = state.stops.find(stop_id);
    if (it == state.stops.end()) {
      throw NotFoundException(fmt::format("Unknown stop {}.", stop_id));
    }

    auto& s = it->second;
    s.visited = visited;
    if (visited) {
      s.visited_at = utils::now_iso8601();
      s.visited_by = driver;
    } else {
      s.visited_at.reset();
      s.visited_by.reset();
    }
    result = s;
    return true;
  });

  spdlog::info("Marked stop {} as {}.",
               result.id,
               visited ? "visited" : "unvisited");
  return result;
}

Route RouteStore::update(std::string_view route_id,
                         const Mutator& mutator,
                         std::optional<Version> expected_version) {
  return commit(
    route_id,
    [&](Route& r, const State& state) {
      const utils::StopLookup stop_lookup = [&state](std::string_view id) {
        return state.find_stop(id);
      };
      return mutator(r, stop_lookup);
    },
    expected_version,
    true);
}

} // namespace canvass
