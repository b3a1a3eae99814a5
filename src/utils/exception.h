#ifndef EXCEPTION_H
#define EXCEPTION_H

/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <exception>
#include <string>

#include "structures/typedefs.h"

namespace canvass {

class Exception : public std::exception {
public:
  const std::string message;
  const ERROR error;
  const unsigned error_code;

  Exception(ERROR error, std::string message);

  const char* what() const noexcept override {
    return message.c_str();
  }
};

class InternalException : public Exception {
public:
  explicit InternalException(const std::string& message);
};

class InputException : public Exception {
public:
  explicit InputException(const std::string& message);
};

// Solver unavailable, failed or returned no usable route.
class SolverException : public Exception {
public:
  explicit SolverException(const std::string& message);
};

class NoEligibleCandidatesException : public Exception {
public:
  explicit NoEligibleCandidatesException(const std::string& message);
};

class DepotConflictException : public Exception {
public:
  const DEPOT_CONFLICT reason;
  const Id stop_id;
  const Id route_id;

  DepotConflictException(DEPOT_CONFLICT reason, Id stop_id, Id route_id);
};

class DepotOnlyCandidateSetException : public Exception {
public:
  explicit DepotOnlyCandidateSetException(const std::string& message);
};

class NotFoundException : public Exception {
public:
  explicit NotFoundException(const std::string& message);
};

// Optimistic concurrency failure on a route edit.
class ConflictException : public Exception {
public:
  explicit ConflictException(const std::string& message);
};

class DepotRemovalException : public Exception {
public:
  explicit DepotRemovalException(const std::string& message);
};

} // namespace canvass

#endif
