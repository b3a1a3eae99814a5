/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "planner/route_planner.h"
#include "reconciliation/route_reconciler.h"
#include "routing/http_solver_wrapper.h"
#include "structures/cl_args.h"
#include "utils/exception.h"
#include "utils/helpers.h"
#include "utils/input_parser.h"
#include "utils/output_json.h"

namespace po = boost::program_options;

namespace {

const std::string USAGE = "Usage:\n  canvass COMMAND [OPTION...]\n\n"
                          "Commands:\n"
                          "  import        add or replace lead records\n"
                          "  optimize      build a route with the solver\n"
                          "  routes        list routes\n"
                          "  remove        remove a stop from a route\n"
                          "  reorder       move a stop within a route\n"
                          "  assign-depot  set the depot of a route\n"
                          "  repair        run the consistency pass\n"
                          "  delete        delete a route\n"
                          "  finish        mark a route as finished\n"
                          "  cancel        cancel a route\n"
                          "  visit         mark a stop as visited\n"
                          "  directions    export directions URLs\n";

std::string read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw canvass::InputException(fmt::format("Can't read file {}.", path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Inline JSON or path to a JSON file.
std::string read_json_argument(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\n");
  if (first != std::string::npos && (value[first] == '{' || value[first] == '[')) {
    return value;
  }
  return read_file(value);
}

canvass::Coordinates parse_pin(const std::string& value) {
  const auto comma = value.find(',');
  if (comma == std::string::npos) {
    throw canvass::InputException(
      fmt::format("Invalid pin '{}', expected lat,lon.", value));
  }
  double lat;
  double lon;
  try {
    lat = std::stod(value.substr(0, comma));
    lon = std::stod(value.substr(comma + 1));
  } catch (const std::logic_error&) {
    throw canvass::InputException(
      fmt::format("Invalid pin '{}', expected lat,lon.", value));
  }
  if (!canvass::valid_coordinates(lat, lon)) {
    throw canvass::InputException(
      fmt::format("Invalid pin '{}', out of range.", value));
  }
  return {lat, lon};
}

template <typename T>
T required(const po::variables_map& vm, const std::string& name) {
  if (!vm.count(name)) {
    throw canvass::InputException(fmt::format("Missing --{} option.", name));
  }
  return vm[name].as<T>();
}

std::optional<canvass::Version> expected_version(const po::variables_map& vm) {
  if (!vm.count("expected-version")) {
    return std::nullopt;
  }
  return vm["expected-version"].as<canvass::Version>();
}

void set_log_level(const std::string& log_level) {
  const auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    throw canvass::InputException(
      fmt::format("Invalid log level '{}'.", log_level));
  }
  spdlog::set_level(level);
}

nlohmann::json run(const std::string& command,
                   const po::variables_map& vm,
                   const canvass::CLArgs& cl_args) {
  using namespace canvass;

  RouteStore store(cl_args.drivers, cl_args.store_path);
  const auto lookup = store.lookup();

  if (command == "import") {
    const auto stops =
      io::parse_stops(read_file(required<std::string>(vm, "input")));
    store.upsert_stops(stops);
    return {{"success", true}, {"imported", stops.size()}};
  }

  if (command == "optimize") {
    OptimizeRequest request;
    request.driver = required<std::string>(vm, "driver");
    request.type = get_route_type(vm["type"].as<std::string>());
    request.vehicle_count = vm["vehicles"].as<unsigned>();
    if (vm.count("area")) {
      request.area =
        io::parse_area(read_json_argument(vm["area"].as<std::string>()));
    }
    if (vm.count("select")) {
      request.selection = vm["select"].as<std::vector<std::string>>();
    }
    if (vm.count("depot") || vm.count("pin")) {
      DepotSelection depot;
      if (vm.count("depot")) {
        depot.stop_id = vm["depot"].as<std::string>();
      }
      if (vm.count("pin")) {
        depot.pin = parse_pin(vm["pin"].as<std::string>());
      }
      request.depot = depot;
    }

    const SolverClient solver(std::make_unique<routing::HttpSolverWrapper>(
      cl_args.solver,
      std::chrono::milliseconds(cl_args.solver_timeout_ms)));
    const RoutePlanner planner(store, solver);

    return io::to_json(planner.optimize(request), lookup);
  }

  if (command == "routes") {
    std::optional<ROUTE_STATUS> status;
    if (vm.count("status")) {
      status = get_route_status(vm["status"].as<std::string>());
    }
    nlohmann::json routes = nlohmann::json::array();
    for (const auto& route : store.get_routes(status)) {
      routes.push_back(io::to_json(route, lookup));
    }
    return {{"success", true}, {"routes", routes}};
  }

  const auto route_id = required<std::string>(vm, "route");
  RouteReconciler reconciler(store);
  Route route;

  if (command == "remove") {
    route = reconciler.remove(route_id,
                              required<std::string>(vm, "row"),
                              vm.count("confirm-depot") > 0,
                              expected_version(vm));
  } else if (command == "reorder") {
    route = reconciler.reorder(route_id,
                               required<std::string>(vm, "row"),
                               required<Index>(vm, "index"),
                               expected_version(vm));
  } else if (command == "assign-depot") {
    route = reconciler.assign_depot(route_id,
                                    required<std::string>(vm, "row"),
                                    expected_version(vm));
  } else if (command == "repair") {
    route = reconciler.repair(route_id);
  } else if (command == "delete") {
    route = store.delete_route(route_id, expected_version(vm));
  } else if (command == "finish") {
    route = store.finish_route(route_id, expected_version(vm));
  } else if (command == "cancel") {
    route = store.cancel_route(route_id, expected_version(vm));
  } else if (command == "directions") {
    route = store.get_route(route_id);
    nlohmann::json urls = nlohmann::json::array();
    for (Index v = 0; v < route.route_data.routes.size(); ++v) {
      urls.push_back(
        {{"vehicle", v + 1},
         {"url", utils::directions_url(route.route_data.routes[v])}});
    }
    return {{"success", true}, {"routeId", route.id}, {"urls", urls}};
  } else {
    throw InputException(fmt::format("Unknown command '{}'.", command));
  }

  return {{"success", true}, {"route", io::to_json(route, lookup)}};
}

nlohmann::json visit(const po::variables_map& vm,
                     const canvass::CLArgs& cl_args) {
  canvass::RouteStore store(cl_args.drivers, cl_args.store_path);

  std::optional<std::string> driver;
  if (vm.count("driver")) {
    driver = vm["driver"].as<std::string>();
  }
  const auto stop = store.set_visited(required<std::string>(vm, "stop"),
                                      driver,
                                      vm.count("unvisited") == 0);
  return {{"success", true}, {"stop", canvass::io::to_json(stop)}};
}

} // namespace

int main(int argc, char** argv) {
  canvass::CLArgs cl_args;

  po::options_description general("General options");
  // clang-format off
  general.add_options()
    ("help,h", "display this help and exit")
    ("config,c", po::value<std::string>(), "JSON config file")
    ("store,s", po::value<std::string>(), "route store snapshot file")
    ("host,a", po::value<std::string>(), "solver host")
    ("port,p", po::value<std::string>(), "solver port")
    ("path", po::value<std::string>(), "solver endpoint path")
    ("timeout,t", po::value<unsigned>(), "solver timeout in milliseconds")
    ("output,o", po::value<std::string>(), "output file name")
    ("log-level,l", po::value<std::string>(), "trace, debug, info, warn, error")
    ("verbose,v", "same as --log-level debug");

  po::options_description command_options("Command options");
  command_options.add_options()
    ("input,i", po::value<std::string>(), "lead records file (import)")
    ("driver", po::value<std::string>(), "driver name (optimize, visit)")
    ("type", po::value<std::string>()->default_value("PREFORECLOSURE"),
     "PROPERTY or PREFORECLOSURE (optimize)")
    ("vehicles", po::value<unsigned>()->default_value(1),
     "1 or 2 vehicles (optimize)")
    ("area", po::value<std::string>(), "zone as JSON or JSON file (optimize)")
    ("select", po::value<std::vector<std::string>>()->multitoken(),
     "explicit stop ids (optimize)")
    ("depot", po::value<std::string>(), "starting point stop id (optimize)")
    ("pin", po::value<std::string>(), "starting point as lat,lon (optimize)")
    ("status", po::value<std::string>(), "route status filter (routes)")
    ("route", po::value<std::string>(), "route id")
    ("row", po::value<std::string>(), "route stop row id")
    ("index", po::value<canvass::Index>(), "new position (reorder)")
    ("confirm-depot", "allow removing the depot (remove)")
    ("expected-version", po::value<canvass::Version>(),
     "fail unless the route is at this version")
    ("stop", po::value<std::string>(), "stop id (visit)")
    ("unvisited", "clear visited state (visit)");

  po::options_description hidden;
  hidden.add_options()
    ("command", po::value<std::string>(), "command");
  // clang-format on

  po::options_description all;
  all.add(general).add(command_options).add(hidden);

  po::positional_options_description positional;
  positional.add("command", 1);

  std::string command;
  try {
    // Standard output is reserved for JSON.
    spdlog::set_default_logger(spdlog::stderr_color_mt("canvass"));

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
              vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << USAGE << "\n" << general << "\n" << command_options;
      return 0;
    }
    if (!vm.count("command")) {
      std::cerr << USAGE;
      throw canvass::InputException("Missing command.");
    }
    command = vm["command"].as<std::string>();

    if (vm.count("config")) {
      canvass::io::parse_config(read_file(vm["config"].as<std::string>()),
                                cl_args);
    }
    if (vm.count("store")) {
      cl_args.store_path = vm["store"].as<std::string>();
    }
    if (vm.count("host")) {
      cl_args.solver.host = vm["host"].as<std::string>();
    }
    if (vm.count("port")) {
      cl_args.solver.port = vm["port"].as<std::string>();
    }
    if (vm.count("path")) {
      cl_args.solver.path = vm["path"].as<std::string>();
    }
    if (vm.count("timeout")) {
      cl_args.solver_timeout_ms = vm["timeout"].as<unsigned>();
    }
    if (vm.count("output")) {
      cl_args.output_file = vm["output"].as<std::string>();
    }
    if (vm.count("log-level")) {
      cl_args.log_level = vm["log-level"].as<std::string>();
    }
    if (vm.count("verbose")) {
      cl_args.log_level = "debug";
    }

    set_log_level(cl_args.log_level);
    if (!cl_args.store_path.has_value()) {
      spdlog::warn("No store file set, changes are not persisted.");
    }

    const auto output =
      (command == "visit") ? visit(vm, cl_args) : run(command, vm, cl_args);
    canvass::io::write_to_output(output, cl_args.output_file);
  } catch (const po::error& e) {
    const canvass::InputException input_error(e.what());
    spdlog::error("{}", input_error.message);
    std::cout << canvass::io::to_json(input_error).dump(2) << std::endl;
    return input_error.error_code;
  } catch (const canvass::Exception& e) {
    spdlog::error("{} failed: {}", command, e.message);
    std::cout << canvass::io::to_json(e).dump(2) << std::endl;
    return e.error_code;
  } catch (const std::exception& e) {
    const canvass::InternalException internal_error(e.what());
    spdlog::error("{} failed: {}", command, internal_error.message);
    std::cout << canvass::io::to_json(internal_error).dump(2) << std::endl;
    return internal_error.error_code;
  }

  return 0;
}
