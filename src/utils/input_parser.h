#ifndef INPUT_PARSER_H
#define INPUT_PARSER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "routing/solver_wrapper.h"
#include "structures/canvass/area.h"
#include "structures/canvass/store_snapshot.h"
#include "structures/cl_args.h"

namespace canvass::io {

// Lead records, either a plain array or an object with a "stops"
// array. Throws InputException.
std::vector<Stop> parse_stops(const std::string& input);

Stop parse_stop(const nlohmann::json& json);

// Rectangle, circle or polygon zone.
Area parse_area(const nlohmann::json& json);

Area parse_area(const std::string& input);

// Apply config file values on top of args.
void parse_config(const std::string& input, CLArgs& args);

// Throws SolverException on anything that is not a solver answer.
routing::SolverResponse parse_solver_response(const std::string& body);

RouteData parse_route_data(const nlohmann::json& json);

Route parse_route(const nlohmann::json& json);

StoreSnapshot parse_snapshot(const std::string& input);

} // namespace canvass::io

#endif
