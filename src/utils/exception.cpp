/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "utils/exception.h"

#include <utility>

#include <fmt/format.h>

namespace canvass {

namespace {

unsigned get_code(ERROR e) {
  switch (e) {
    using enum ERROR;
  case INTERNAL:
    return 1;
  case INPUT:
    return 2;
  case SOLVER:
    return 3;
  case NO_CANDIDATES:
    return 4;
  case DEPOT_CONFLICT:
    return 5;
  case DEPOT_ONLY:
    return 6;
  case NOT_FOUND:
    return 7;
  case CONFLICT:
    return 8;
  case DEPOT_REMOVAL:
    return 9;
  }
  return 1;
}

std::string depot_conflict_message(DEPOT_CONFLICT reason,
                                   const Id& stop_id,
                                   const Id& route_id) {
  switch (reason) {
  case DEPOT_CONFLICT::ALREADY_DEPOT:
    return fmt::format("Stop {} is already the starting point of active "
                       "route {}.",
                       stop_id,
                       route_id);
  case DEPOT_CONFLICT::ALREADY_ROUTED:
    return fmt::format("Stop {} is already a stop of active route {} and "
                       "cannot be used as a starting point.",
                       stop_id,
                       route_id);
  }
  return fmt::format("Stop {} cannot be used as a starting point.", stop_id);
}

} // namespace

Exception::Exception(ERROR error, std::string message)
  : message(std::move(message)), error(error), error_code(get_code(error)) {
}

InternalException::InternalException(const std::string& message)
  : Exception(ERROR::INTERNAL, message) {
}

InputException::InputException(const std::string& message)
  : Exception(ERROR::INPUT, message) {
}

SolverException::SolverException(const std::string& message)
  : Exception(ERROR::SOLVER, message) {
}

NoEligibleCandidatesException::NoEligibleCandidatesException(
  const std::string& message)
  : Exception(ERROR::NO_CANDIDATES, message) {
}

DepotConflictException::DepotConflictException(DEPOT_CONFLICT reason,
                                               Id stop_id,
                                               Id route_id)
  : Exception(ERROR::DEPOT_CONFLICT,
              depot_conflict_message(reason, stop_id, route_id)),
    reason(reason),
    stop_id(std::move(stop_id)),
    route_id(std::move(route_id)) {
}

DepotOnlyCandidateSetException::DepotOnlyCandidateSetException(
  const std::string& message)
  : Exception(ERROR::DEPOT_ONLY, message) {
}

NotFoundException::NotFoundException(const std::string& message)
  : Exception(ERROR::NOT_FOUND, message) {
}

ConflictException::ConflictException(const std::string& message)
  : Exception(ERROR::CONFLICT, message) {
}

DepotRemovalException::DepotRemovalException(const std::string& message)
  : Exception(ERROR::DEPOT_REMOVAL, message) {
}

} // namespace canvass
