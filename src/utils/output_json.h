#ifndef OUTPUT_JSON_H
#define OUTPUT_JSON_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "routing/solver_wrapper.h"
#include "structures/canvass/input/optimize_request.h"
#include "structures/canvass/store_snapshot.h"
#include "utils/exception.h"
#include "utils/projection.h"

namespace canvass::io {

nlohmann::json to_json(const Stop& stop);

nlohmann::json to_json(const RouteData& data);

// Rows reference stops by id only.
nlohmann::json to_json(const Route& route);

// Rows carry the full stop record as well.
nlohmann::json to_json(const Route& route, const utils::StopLookup& lookup);

nlohmann::json to_json(const OptimizeResult& result,
                       const utils::StopLookup& lookup);

nlohmann::json to_json(const routing::SolverRequest& request);

nlohmann::json to_json(const StoreSnapshot& snapshot);

// Error report as {"code", "error"}.
nlohmann::json to_json(const Exception& e);

void write_to_output(const nlohmann::json& document,
                     const std::optional<std::filesystem::path>& output_file);

} // namespace canvass::io

#endif
