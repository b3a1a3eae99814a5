/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include "routing/http_solver_wrapper.h"

#include <array>
#include <functional>
#include <utility>

#include <boost/asio.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/exception.h"
#include "utils/input_parser.h"
#include "utils/output_json.h"

using boost::asio::ip::tcp;

namespace canvass::routing {

namespace {

constexpr std::string_view HEADER_END = "\r\n\r\n";

unsigned get_status(const std::string& response) {
  // Status line is "HTTP/1.x NNN reason".
  const auto space = response.find(' ');
  if (!response.starts_with("HTTP/") || space == std::string::npos ||
      response.size() < space + 4) {
    throw SolverException("Invalid solver response.");
  }
  unsigned status = 0;
  for (Index i = space + 1; i < space + 4; ++i) {
    const char c = response[i];
    if (c < '0' || '9' < c) {
      throw SolverException("Invalid solver response.");
    }
    status = 10 * status + static_cast<unsigned>(c - '0');
  }
  return status;
}

} // namespace

HttpSolverWrapper::HttpSolverWrapper(Server server,
                                     std::chrono::milliseconds timeout)
  : _server(std::move(server)), _timeout(timeout) {
}

std::string HttpSolverWrapper::build_query(const std::string& body) const {
  std::string query = "POST " + _server.path + " HTTP/1.0\r\n";
  query += "Host: " + _server.host + "\r\n";
  query += "Accept: application/json\r\n";
  query += "Content-Type: application/json\r\n";
  query += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  query += "Connection: close\r\n\r\n";
  query += body;

  return query;
}

std::string HttpSolverWrapper::send_then_receive(
  const std::string& query) const {
  boost::asio::io_context io_context;
  tcp::resolver resolver(io_context);
  tcp::socket socket(io_context);

  std::string response;
  std::array<char, 4096> buffer;
  boost::system::error_code failure;

  std::function<void()> read_some = [&]() {
    socket.async_read_some(boost::asio::buffer(buffer),
                           [&](const boost::system::error_code& ec,
                               std::size_t length) {
                             response.append(buffer.data(), length);
                             if (ec == boost::asio::error::eof) {
                               return;
                             }
                             if (ec) {
                               failure = ec;
                               return;
                             }
                             read_some();
                           });
  };

  resolver.async_resolve(
    _server.host,
    _server.port,
    [&](const boost::system::error_code& resolve_ec,
        const tcp::resolver::results_type& endpoints) {
      if (resolve_ec) {
        failure = resolve_ec;
        return;
      }
      boost::asio::async_connect(
        socket,
        endpoints,
        [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
          if (connect_ec) {
            failure = connect_ec;
            return;
          }
          boost::asio::async_write(socket,
                                   boost::asio::buffer(query),
                                   [&](const boost::system::error_code& write_ec,
                                       std::size_t) {
                                     if (write_ec) {
                                       failure = write_ec;
                                       return;
                                     }
                                     read_some();
                                   });
        });
    });

  io_context.run_for(_timeout);

  if (!io_context.stopped()) {
    throw SolverException(fmt::format("Solver at {}:{} timed out after {} ms.",
                                      _server.host,
                                      _server.port,
                                      _timeout.count()));
  }
  if (failure) {
    throw SolverException(fmt::format("Failed to reach solver at {}:{}: {}.",
                                      _server.host,
                                      _server.port,
                                      failure.message()));
  }

  return response;
}

SolverResponse HttpSolverWrapper::solve(const SolverRequest& request) const {
  const std::string body = io::to_json(request).dump();
  spdlog::debug("Sending {} stop(s) to solver at {}:{}{} ({} bytes).",
                request.stops.size(),
                _server.host,
                _server.port,
                _server.path,
                body.size());

  const std::string response = send_then_receive(build_query(body));

  const auto status = get_status(response);
  const auto header_end = response.find(HEADER_END);
  if (header_end == std::string::npos) {
    throw SolverException("Invalid solver response.");
  }
  const std::string payload = response.substr(header_end + HEADER_END.size());

  if (status != 200) {
    std::string error = fmt::format("Solver answered with HTTP status {}.",
                                    status);
    const auto json = nlohmann::json::parse(payload, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("error") &&
        json["error"].is_string()) {
      error = json["error"].get<std::string>();
    }
    throw SolverException(error);
  }

  return io::parse_solver_response(payload);
}

} // namespace canvass::routing
