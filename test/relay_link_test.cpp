#include "tether/frame.hpp"
#include "tether/coroutine.hpp"
#include "tether/relay_link.hpp"
#include "tether/multi_stream.hpp"
#include "tether/framed_stream.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "support.hpp"

#include <catch2/catch.hpp>

namespace asio = boost::asio;

using asio::ip::tcp;
using boost::system::error_code;
using tether::frame_type;

using namespace std::chrono_literals;

TEST_CASE("Our relay link") {
  SECTION("should hold one connection and replace it when it drops") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());

    auto options               = tether::link_options();
    options.host               = "127.0.0.1";
    options.port               = tether::test::port_of(acceptor.local_endpoint());
    options.reconnect_interval = 100ms;

    auto link     = tether::relay_link(io.get_executor(), options);
    auto closes   = 0;
    auto received = std::vector<std::string>();

    link.on_close([&]() { ++closes; });
    link.on_message(
      [&](tether::frame f) { received.push_back(std::move(f.payload)); });

    auto accepted = 0;
    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto ec          = error_code();
        auto error_token = tether::redirect_error(tether::use_awaitable, ec);

        // asking repeatedly must not open more than one connection
        //
        link.ensure_connected();
        link.ensure_connected();
        CHECK(link.is_connecting());

        auto socket = co_await acceptor.async_accept(error_token);
        REQUIRE_FALSE(ec);
        ++accepted;

        auto connected = co_await link.async_wait_connected(1s);
        CHECK(connected);
        link.ensure_connected();

        auto first = tether::framed_stream(tether::multi_stream(std::move(socket)));
        first.send(frame_type::response, "one");

        co_await tether::test::sleep_for(50ms);
        CHECK(received == std::vector<std::string>{"one"});
        CHECK(link.connect_count() == 1);

        // dropping the connection schedules exactly one reconnect
        //
        first.close();

        auto second_socket = co_await acceptor.async_accept(error_token);
        REQUIRE_FALSE(ec);
        ++accepted;

        co_await tether::test::sleep_for(50ms);
        CHECK(closes == 1);
        CHECK(link.is_connected());
        CHECK(link.connect_count() == 2);
        CHECK_FALSE(link.reconnect_pending());

        auto second = tether::framed_stream(
          tether::multi_stream(std::move(second_socket)));

        CHECK(link.send(frame_type::request, "ping"));

        auto f = co_await second.async_read_frame(error_token);
        CHECK_FALSE(ec);
        CHECK(f.is(frame_type::request));
        CHECK(f.payload == "ping");

        link.close();
        second.close();
        acceptor.close();

        finished = true;
        io.stop();
      },
      tether::detached);

    io.run_for(10s);

    REQUIRE(finished);
    CHECK(accepted == 2);
  }

  SECTION("should keep retrying while the relay is down") {
    asio::io_context io;

    auto options               = tether::link_options();
    options.host               = "127.0.0.1";
    options.port               = tether::test::closed_port(io.get_executor());
    options.reconnect_interval = 50ms;

    auto link     = tether::relay_link(io.get_executor(), options);
    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        link.ensure_connected();

        auto const connected = co_await link.async_wait_connected(1s);
        CHECK_FALSE(connected);
        CHECK_FALSE(link.is_connected());
        CHECK(link.reconnect_pending());
        CHECK_FALSE(link.send(frame_type::request, "{}"));

        // several retry rounds later nothing has connected and a single
        // retry is still queued
        //
        co_await tether::test::sleep_for(200ms);
        CHECK(link.connect_count() == 0);
        CHECK((link.reconnect_pending() || link.is_connecting()));

        link.close();
        finished = true;
        io.stop();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }
}
