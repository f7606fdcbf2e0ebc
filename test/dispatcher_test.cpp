#include "tether/frame.hpp"
#include "tether/error.hpp"
#include "tether/envelope.hpp"
#include "tether/coroutine.hpp"
#include "tether/dispatcher.hpp"
#include "tether/framed_stream.hpp"
#include "tether/client_session.hpp"
#include "tether/detail/signal.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>

#include <boost/beast/core/buffers_to_string.hpp>

#include <array>
#include <chrono>
#include <deque>
#include <string>
#include <vector>

#include "support.hpp"

#include <catch2/catch.hpp>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;

using asio::ip::tcp;
using boost::system::error_code;
using tether::frame_type;

using namespace std::chrono_literals;

namespace {

auto test_options() -> tether::dispatcher_options {
  auto options         = tether::dispatcher_options();
  options.connect_wait = 1s;
  return options;
}

auto relay_mode_options() -> tether::dispatcher_options {
  auto options   = test_options();
  options.tunnel = tether::tunnel_mode::relay;
  return options;
}

auto url_of(tether::frame const& f) -> std::string {
  auto ec             = error_code();
  auto const envelope = tether::parse_request_envelope(f.payload, ec);
  CHECK_FALSE(ec);
  return envelope.url;
}

} // anonymous

TEST_CASE("Our local sequential dispatcher") {
  SECTION("should serve requests one at a time in arrival order") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      test_options());

    auto events   = std::vector<std::string>();
    auto pending  = std::deque<std::string>();
    auto arrived  = tether::detail::async_event(io.get_executor());
    auto finished = 0;

    // the relay logs when frames arrive and when it answers them; answers are
    // slow so any request sent early would show up between the two
    //
    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);

        tether::co_spawn(
          io,
          [&, relay]() mutable -> tether::awaitable<void> {
            auto ec = error_code();
            while (true) {
              auto f = co_await relay.async_read_frame(
                tether::redirect_error(tether::use_awaitable, ec));
              if (ec) { break; }

              events.push_back("recv " + url_of(f));
              pending.push_back(url_of(f));
              arrived.set();
            }
          },
          tether::detached);

        for (auto answered = 0; answered < 3; ++answered) {
          while (pending.empty()) {
            arrived.reset();
            co_await arrived.async_wait();
          }

          auto const url = pending.front();
          pending.pop_front();

          co_await tether::test::sleep_for(50ms);
          events.push_back("send " + url);

          // frames of unknown types are passed over by the agent
          //
          CHECK(relay.send(static_cast<frame_type>(9), "noise"));
          tether::test::answer(relay, 200, url);
        }
      },
      tether::detached);

    auto const client = [&](std::string path, std::chrono::milliseconds delay)
      -> tether::awaitable<void> {

      co_await tether::test::sleep_for(delay);

      auto const url      = "http://origin.test" + path;
      auto const response = co_await tether::test::proxy_request(
        agent.port(), tether::test::make_get(url, "origin.test"));

      CHECK(response.result() == http::status::ok);
      CHECK(response.body() == url);

      if (++finished == 3) {
        agent.stop();
        io.stop();
      }
    };

    tether::co_spawn(io, client("/a", 0ms), tether::detached);
    tether::co_spawn(io, client("/b", 30ms), tether::detached);
    tether::co_spawn(io, client("/c", 60ms), tether::detached);

    io.run_for(10s);

    REQUIRE(finished == 3);
    CHECK(
      events == std::vector<std::string>{
        "recv http://origin.test/a", "send http://origin.test/a",
        "recv http://origin.test/b", "send http://origin.test/b",
        "recv http://origin.test/c", "send http://origin.test/c"});
  }

  SECTION("should time out a request and drop its late answer") {
    asio::io_context io;

    auto options             = test_options();
    options.response_timeout = 300ms;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      options);

    auto finished = 0;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);
        auto ec    = error_code();

        auto first = co_await relay.async_read_frame(
          tether::redirect_error(tether::use_awaitable, ec));
        CHECK(url_of(first) == "http://origin.test/first");

        // answered well after the agent gave up on it
        //
        co_await tether::test::sleep_for(450ms);
        tether::test::answer(relay, 200, "first");

        auto second = co_await relay.async_read_frame(
          tether::redirect_error(tether::use_awaitable, ec));
        CHECK(url_of(second) == "http://origin.test/second");
        tether::test::answer(relay, 200, "second");

        co_await tether::test::sleep_for(24h);
      },
      tether::detached);

    auto const done = [&]() {
      if (++finished == 2) {
        agent.stop();
        io.stop();
      }
    };

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/first", "origin.test"));

        CHECK(response.result() == http::status::gateway_timeout);
        CHECK(response.body() == "Gateway Timeout");
        done();
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        co_await tether::test::sleep_for(50ms);

        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/second", "origin.test"));

        CHECK(response.result() == http::status::ok);
        CHECK(response.body() == "second");
        CHECK(agent.requests.abandoned() == 0);
        done();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished == 2);
  }

  SECTION("should answer 502 when the relay cannot be reached") {
    asio::io_context io;

    auto agent = tether::test::agent(
      io.get_executor(),
      tether::test::closed_port(io.get_executor()),
      test_options());

    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/", "origin.test"));

        CHECK(response.result() == http::status::bad_gateway);
        CHECK(response.body() == "Bad Gateway: relay unavailable");

        co_await tether::test::sleep_for(20ms);
        CHECK(agent.requests.queue_size() == 0);

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }

  SECTION("should answer 502 when the relay connection drops mid-request") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      test_options());

    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);
        auto ec    = error_code();

        co_await relay.async_read_frame(
          tether::redirect_error(tether::use_awaitable, ec));
        CHECK_FALSE(ec);

        relay.close();
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/", "origin.test"));

        CHECK(response.result() == http::status::bad_gateway);
        CHECK(response.body() == "Bad Gateway: relay connection lost");

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }

  SECTION("should answer 502 for an answer it cannot decode") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      test_options());

    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);
        auto ec    = error_code();

        co_await relay.async_read_frame(
          tether::redirect_error(tether::use_awaitable, ec));
        CHECK(relay.send(frame_type::response, "{not json"));

        co_await tether::test::sleep_for(24h);
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/", "origin.test"));

        CHECK(response.result() == http::status::bad_gateway);
        CHECK(response.body() == "Bad Gateway");

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }

  SECTION("should discard a queued request whose client hung up") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      test_options());

    auto received    = std::vector<std::string>();
    auto client_gone = tether::detail::async_event(io.get_executor());
    auto finished    = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);

        tether::co_spawn(
          io,
          [&, relay]() mutable -> tether::awaitable<void> {
            auto ec = error_code();
            while (true) {
              auto f = co_await relay.async_read_frame(
                tether::redirect_error(tether::use_awaitable, ec));
              if (ec) { break; }

              if (f.is(frame_type::request)) {
                received.push_back(url_of(f));
              }
            }
          },
          tether::detached);

        // the first request is held until the client queued behind it left
        //
        co_await client_gone.async_wait();
        co_await tether::test::sleep_for(100ms);

        tether::test::answer(relay, 200, "kept");
        co_await tether::test::sleep_for(24h);
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(),
          tether::test::make_get("http://origin.test/kept", "origin.test"));

        CHECK(response.result() == http::status::ok);
        CHECK(response.body() == "kept");

        // long enough for a wrongly forwarded request to reach the relay
        //
        co_await tether::test::sleep_for(200ms);

        CHECK(received == std::vector<std::string>{"http://origin.test/kept"});
        CHECK(agent.requests.queue_size() == 0);

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        co_await tether::test::sleep_for(50ms);

        auto ec     = error_code();
        auto token  = tether::redirect_error(tether::use_awaitable, ec);
        auto socket = tcp::socket(io);

        co_await socket.async_connect(agent.proxy.local_endpoint(), token);
        CHECK_FALSE(ec);

        auto request =
          tether::test::make_get("http://origin.test/gone", "origin.test");

        co_await http::async_write(socket, request, token);
        CHECK_FALSE(ec);

        while (agent.requests.queue_size() < 2) {
          co_await tether::test::sleep_for(10ms);
        }

        socket.close(ec);
        client_gone.set();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }

  SECTION("should keep a timed out relayed tunnel apart from the next one") {
    asio::io_context io;

    auto options             = relay_mode_options();
    options.response_timeout = 300ms;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      options);

    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);
        auto ec    = error_code();
        auto token = tether::redirect_error(tether::use_awaitable, ec);

        auto first = co_await relay.async_read_frame(token);
        CHECK(first.is(frame_type::request));
        CHECK(url_of(first) == "first.test:443");

        // the agent withdraws the tunnel it stopped waiting for
        //
        auto withdrawn = co_await relay.async_read_frame(token);
        CHECK(withdrawn.is(frame_type::tunnel_close));

        auto second = co_await relay.async_read_frame(token);
        CHECK(url_of(second) == "second.test:443");

        // the first tunnel's late ack and traffic arrive ahead of the ack for
        // the second
        //
        CHECK(relay.send(frame_type::response, tether::tunnel_ack_ok));
        CHECK(relay.send(frame_type::tunnel_data, "stale"));
        CHECK(relay.send(frame_type::tunnel_close, ""));
        CHECK(relay.send(frame_type::response, tether::tunnel_ack_ok));
        CHECK(relay.send(frame_type::tunnel_data, "fresh"));

        auto ping = co_await relay.async_read_frame(token);
        CHECK_FALSE(ec);
        CHECK(ping.is(frame_type::tunnel_data));
        CHECK(ping.payload == "ping");

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const timed_out = co_await tether::test::proxy_request(
          agent.port(), tether::test::make_connect("first.test:443"));

        CHECK(timed_out.result() == http::status::gateway_timeout);

        auto ec     = error_code();
        auto token  = tether::redirect_error(tether::use_awaitable, ec);
        auto client = tether::client_session(co_await tether::this_coro::executor);

        co_await client.async_connect("127.0.0.1", agent.port(), token);
        CHECK_FALSE(ec);

        auto request = tether::test::make_connect("second.test:443");

        http::response_parser<http::empty_body>
        parser;

        parser.skip(true);

        co_await client.async_request(request, parser, token);
        CHECK_FALSE(ec);
        CHECK(parser.get().result() == http::status::ok);

        // tunnel bytes may have been read along with the response head
        //
        auto received = beast::buffers_to_string(client.buffer().data());
        client.buffer().consume(client.buffer().size());

        auto buf = std::array<char, 64>();
        while (!ec && received.size() < 5) {
          auto const n = co_await client.stream().async_read_some(
            asio::buffer(buf), token);
          received.append(buf.data(), n);
        }

        CHECK(received == "fresh");

        auto const ping = std::string("ping");
        co_await asio::async_write(client.stream(), asio::buffer(ping), token);
        CHECK_FALSE(ec);

        co_await tether::test::sleep_for(24h);
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }

  SECTION("should answer 502 when the relay cannot open a tunnel") {
    asio::io_context io;

    auto acceptor = tcp::acceptor(io, tether::test::loopback());
    auto agent    = tether::test::agent(
      io.get_executor(),
      tether::test::port_of(acceptor.local_endpoint()),
      relay_mode_options());

    auto finished = false;

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto relay = co_await tether::test::accept_agent(acceptor);
        auto ec    = error_code();

        auto f = co_await relay.async_read_frame(
          tether::redirect_error(tether::use_awaitable, ec));
        CHECK(url_of(f) == "refused.test:443");
        CHECK(relay.send(frame_type::response, tether::tunnel_ack_fail));

        co_await tether::test::sleep_for(24h);
      },
      tether::detached);

    tether::co_spawn(
      io,
      [&]() -> tether::awaitable<void> {
        auto const response = co_await tether::test::proxy_request(
          agent.port(), tether::test::make_connect("refused.test:443"));

        CHECK(response.result() == http::status::bad_gateway);
        CHECK(response.body() == "Bad Gateway");

        finished = true;
        agent.stop();
        io.stop();
      },
      tether::detached);

    io.run_for(10s);
    REQUIRE(finished);
  }
}
