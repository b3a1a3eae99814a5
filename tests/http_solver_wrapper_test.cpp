/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include "routing/http_solver_wrapper.h"
#include "utils/exception.h"

using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace canvass::routing {
namespace {

// Serves a single canned HTTP response on a loopback port.
class OneShotServer {
private:
  boost::asio::io_context _io;
  tcp::acceptor _acceptor{_io,
                          tcp::endpoint(boost::asio::ip::address_v4::loopback(),
                                        0)};
  std::string _request;
  std::thread _thread;

  void serve(const std::string& response, std::chrono::milliseconds delay) {
    tcp::socket socket(_io);
    boost::system::error_code ec;
    _acceptor.accept(socket, ec);
    if (ec) {
      return;
    }

    boost::asio::streambuf buffer;
    const auto header_size =
      boost::asio::read_until(socket, buffer, "\r\n\r\n", ec);
    if (ec) {
      return;
    }
    std::string data(boost::asio::buffers_begin(buffer.data()),
                     boost::asio::buffers_end(buffer.data()));

    const std::string key = "Content-Length: ";
    const auto length_start = data.find(key);
    if (length_start != std::string::npos) {
      const auto length =
        std::stoul(data.substr(length_start + key.size(),
                               data.find("\r\n", length_start) - length_start -
                                 key.size()));
      const auto received = data.size() - header_size;
      if (received < length) {
        boost::asio::read(socket,
                          buffer,
                          boost::asio::transfer_exactly(length - received),
                          ec);
        data.assign(boost::asio::buffers_begin(buffer.data()),
                    boost::asio::buffers_end(buffer.data()));
      }
    }
    _request = data;

    std::this_thread::sleep_for(delay);
    boost::asio::write(socket, boost::asio::buffer(response), ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

public:
  explicit OneShotServer(std::string response,
                         std::chrono::milliseconds delay = 0ms) {
    _thread = std::thread(
      [this, response = std::move(response), delay] { serve(response, delay); });
  }

  ~OneShotServer() {
    _thread.join();
  }

  Server server() const {
    return {"127.0.0.1",
            std::to_string(_acceptor.local_endpoint().port()),
            "/api/routing/solve"};
  }

  const std::string& request() const {
    return _request;
  }
};

SolverRequest small_request() {
  SolverRequest request;
  request.stops = {{"d", {29.40, -98.50}, "1 D St"},
                   {"a", {29.41, -98.50}, "1 A St"}};
  request.depot_pin = Coordinates{29.40, -98.50};
  request.depot_id = "d";
  return request;
}

std::string http_response(const std::string& status, const std::string& body) {
  return "HTTP/1.1 " + status +
         "\r\nContent-Type: application/json\r\nContent-Length: " +
         std::to_string(body.size()) + "\r\n\r\n" + body;
}

TEST(HttpSolverWrapperTest, PostsJsonAndParsesAnswer) {
  std::string request_text;
  SolverResponse response;
  {
    OneShotServer server(http_response(
      "200 OK",
      R"({"success": true, "routes": [{"waypoints": [
          {"id": "depot", "lat": 29.4, "lon": -98.5, "originalId": "d",
           "isDepot": true},
          {"id": "a", "lat": 29.41, "lon": -98.5}], "distance": 1.1}],
          "totalDistance": 1.1})"));
    const HttpSolverWrapper wrapper(server.server(), 2000ms);

    response = wrapper.solve(small_request());
    request_text = server.request();
  }

  EXPECT_TRUE(response.success);
  ASSERT_EQ(response.routes.size(), 1u);
  EXPECT_EQ(response.routes[0].waypoints.size(), 2u);

  EXPECT_TRUE(request_text.starts_with("POST /api/routing/solve HTTP/1.0"));
  EXPECT_NE(request_text.find("Content-Type: application/json"),
            std::string::npos);
  EXPECT_NE(request_text.find(R"("depotPropertyId":"d")"), std::string::npos);
  EXPECT_NE(request_text.find(R"("numVehicles":1)"), std::string::npos);
}

TEST(HttpSolverWrapperTest, ErrorStatusCarriesSolverMessage) {
  OneShotServer server(http_response(
    "400 Bad Request",
    R"({"success": false, "error": "At least 2 properties are required"})"));
  const HttpSolverWrapper wrapper(server.server(), 2000ms);

  try {
    wrapper.solve(small_request());
    FAIL() << "Expected SolverException";
  } catch (const SolverException& e) {
    EXPECT_EQ(e.message, "At least 2 properties are required");
  }
}

TEST(HttpSolverWrapperTest, GarbageIsRejected) {
  OneShotServer server(http_response("200 OK", "<html>oops</html>"));
  const HttpSolverWrapper wrapper(server.server(), 2000ms);

  EXPECT_THROW(wrapper.solve(small_request()), SolverException);
}

TEST(HttpSolverWrapperTest, SlowSolverTimesOut) {
  OneShotServer server(http_response("200 OK", R"({"success": true})"),
                       1500ms);
  const HttpSolverWrapper wrapper(server.server(), 100ms);

  EXPECT_THROW(wrapper.solve(small_request()), SolverException);
}

TEST(HttpSolverWrapperTest, UnreachableSolver) {
  std::string port;
  {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io,
                           tcp::endpoint(boost::asio::ip::address_v4::loopback(),
                                         0));
    port = std::to_string(acceptor.local_endpoint().port());
  }
  const HttpSolverWrapper wrapper({"127.0.0.1", port, "/"}, 1000ms);

  EXPECT_THROW(wrapper.solve(small_request()), SolverException);
}

} // namespace
} // namespace canvass::routing
