#ifndef HTTP_SOLVER_WRAPPER_H
#define HTTP_SOLVER_WRAPPER_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <chrono>
#include <string>

#include "routing/solver_wrapper.h"
#include "structures/cl_args.h"

namespace canvass::routing {

// Posts JSON requests to a solver HTTP endpoint.
class HttpSolverWrapper : public SolverWrapper {
private:
  const Server _server;
  const std::chrono::milliseconds _timeout;

  std::string build_query(const std::string& body) const;

  std::string send_then_receive(const std::string& query) const;

public:
  HttpSolverWrapper(Server server, std::chrono::milliseconds timeout);

  SolverResponse solve(const SolverRequest& request) const override;
};

} // namespace canvass::routing

#endif
