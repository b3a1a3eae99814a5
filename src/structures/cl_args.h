#ifndef CL_ARGS_H
#define CL_ARGS_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "structures/typedefs.h"

namespace canvass {

struct Server {
  std::string host{DEFAULT_SOLVER_HOST};
  std::string port{DEFAULT_SOLVER_PORT};
  std::string path{DEFAULT_SOLVER_PATH};
};

// Settings from the config file, overridden by command line options.
struct CLArgs {
  Server solver;
  unsigned solver_timeout_ms{DEFAULT_SOLVER_TIMEOUT_MS};
  std::optional<std::filesystem::path> store_path;
  std::vector<std::string> drivers{"Luciano", "Raul"};
  std::string log_level{"info"};
  std::optional<std::filesystem::path> output_file;
};

} // namespace canvass

#endif
