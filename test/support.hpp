#ifndef TETHER_TEST_SUPPORT_HPP_
#define TETHER_TEST_SUPPORT_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>

#include <boost/beast/http.hpp>

#include <boost/system/error_code.hpp>

#include <array>
#include <chrono>
#include <string>
#include <cstddef>
#include <sstream>
#include <iostream>

#include "tether/frame.hpp"
#include "tether/coroutine.hpp"
#include "tether/envelope.hpp"
#include "tether/dispatcher.hpp"
#include "tether/relay_link.hpp"
#include "tether/multi_stream.hpp"
#include "tether/framed_stream.hpp"
#include "tether/forward_proxy.hpp"
#include "tether/server_session.hpp"
#include "tether/client_session.hpp"

#include <catch2/catch.hpp>

namespace tether {
namespace test {

namespace asio = boost::asio;
namespace http = boost::beast::http;

using asio::ip::tcp;
using boost::system::error_code;

inline auto loopback() -> tcp::endpoint {
  return tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0);
}

inline auto port_of(tcp::endpoint const& endpoint) -> std::string {
  return std::to_string(endpoint.port());
}

// a loopback port nothing listens on
//
inline auto closed_port(asio::any_io_executor const& executor) -> std::string {
  auto acceptor = tcp::acceptor(executor, loopback());
  auto const port = port_of(acceptor.local_endpoint());
  acceptor.close();
  return port;
}

inline auto sleep_for(std::chrono::steady_clock::duration const d)
  -> awaitable<void> {

  auto timer = asio::steady_timer(co_await this_coro::executor, d);
  auto ec    = error_code();
  co_await timer.async_wait(redirect_error(use_awaitable, ec));
}

// answers GET /hello with "hello", echoes request bodies sent to /echo and
// reports 404 for everything else
//
inline auto serve_origin_connection(tcp::socket socket) -> awaitable<void> {
  auto session = server_session(multi_stream(std::move(socket)));
  auto ec      = error_code();

  while (true) {
    http::request_parser<http::string_body>
    parser;

    co_await session.async_read(parser, redirect_error(use_awaitable, ec));
    if (ec) { break; }

    auto request  = parser.release();
    auto response = response_type(http::status::ok, request.version());
    response.set(http::field::content_type, "text/plain");

    if (request.target() == "/hello") {
      response.body() = "hello";
    } else if (request.target() == "/echo") {
      response.set("X-Method", request.method_string());
      response.body() = request.body();
    } else {
      response.result(http::status::not_found);
      response.body() = "not found";
    }

    response.keep_alive(request.keep_alive());
    response.prepare_payload();

    co_await session.async_write(response, redirect_error(use_awaitable, ec));
    if (ec || !request.keep_alive()) { break; }
  }

  session.shutdown();
  session.close();
}

// writes back every byte it reads until the peer closes
//
inline auto serve_echo_connection(tcp::socket socket) -> awaitable<void> {
  auto ec  = error_code();
  auto buf = std::array<char, 1024>();

  while (true) {
    auto const n = co_await socket.async_read_some(
      asio::buffer(buf), redirect_error(use_awaitable, ec));
    if (ec) { break; }

    co_await asio::async_write(
      socket, asio::buffer(buf.data(), n), redirect_error(use_awaitable, ec));
    if (ec) { break; }
  }

  socket.close(ec);
}

// a loopback listener handing every accepted socket to `Serve`
//
template <awaitable<void> (*Serve)(tcp::socket)>
struct loopback_server {
  tcp::acceptor acceptor;
  std::size_t   accepted = 0;

  explicit
  loopback_server(asio::any_io_executor const& executor)
  : acceptor(executor, loopback())
  {
  }

  auto port() const -> std::string {
    return port_of(acceptor.local_endpoint());
  }

  auto run() -> void {
    co_spawn(acceptor.get_executor(), accept_loop(), detached);
  }

  auto close() -> void {
    auto ec = error_code();
    acceptor.close(ec);
  }

private:
  auto accept_loop() -> awaitable<void> {
    auto ec = error_code();
    while (true) {
      auto socket = co_await acceptor.async_accept(
        redirect_error(use_awaitable, ec));
      if (ec) { break; }

      ++accepted;
      co_spawn(acceptor.get_executor(), Serve(std::move(socket)), detached);
    }
  }
};

using origin_server = loopback_server<&serve_origin_connection>;
using echo_server   = loopback_server<&serve_echo_connection>;

// issues one request through the proxy on a fresh connection
//
inline auto proxy_request(std::string const port, request_type request)
  -> awaitable<response_type> {

  auto client = client_session(co_await this_coro::executor);
  auto ec     = error_code();

  co_await client.async_connect(
    "127.0.0.1", port, redirect_error(use_awaitable, ec));
  CHECK_FALSE(ec);

  http::response_parser<http::string_body>
  parser;

  if (!ec) {
    co_await client.async_request(
      request, parser, redirect_error(use_awaitable, ec));
    CHECK_FALSE(ec);
  }

  client.close();

  if (ec) {
    auto failed = response_type();
    failed.result(0);
    co_return failed;
  }

  co_return parser.release();
}

inline auto make_get(std::string const& url, std::string const& host)
  -> request_type {

  auto request = request_type(http::verb::get, url, 11);
  request.set(http::field::host, host);
  return request;
}

inline auto make_connect(std::string const& authority) -> request_type {
  auto request = request_type(http::verb::connect, authority, 11);
  request.set(http::field::host, authority);
  return request;
}

// collects what is written to std::cerr while alive
//
struct log_capture {
  std::ostringstream out;
  std::streambuf*    saved;

  log_capture()
  : saved(std::cerr.rdbuf(out.rdbuf()))
  {
  }

  ~log_capture() {
    std::cerr.rdbuf(saved);
  }

  auto text() const -> std::string {
    return out.str();
  }
};

// the agent side wired together: relay link, dispatcher and local proxy
//
struct agent {
  relay_link    link;
  dispatcher    requests;
  forward_proxy proxy;

  agent(
    asio::any_io_executor const& executor,
    std::string const&           relay_port,
    dispatcher_options const&    options)
  : link(executor, make_link_options(relay_port))
  , requests(executor, link, options)
  , proxy(executor, loopback(), true, requests)
  {
    proxy.run();
  }

  auto port() const -> std::string {
    return port_of(proxy.local_endpoint());
  }

  auto stop() -> void {
    proxy.close();
    link.close();
  }

  static auto make_link_options(std::string const& relay_port)
    -> link_options {

    auto options = link_options();
    options.host = "127.0.0.1";
    options.port = relay_port;
    return options;
  }
};

// stands in for the relay: accepts the agent's connection as a frame channel
//
inline auto accept_agent(tcp::acceptor& acceptor) -> awaitable<framed_stream> {
  auto ec     = error_code();
  auto socket = co_await acceptor.async_accept(
    redirect_error(use_awaitable, ec));

  CHECK_FALSE(ec);
  co_return framed_stream(multi_stream(std::move(socket)));
}

inline auto answer(
  framed_stream&     relay,
  unsigned const     status,
  std::string const& body) -> void {

  auto envelope        = response_envelope();
  envelope.status_code = status;
  envelope.headers.emplace_back("Content-Type", "text/plain");
  envelope.body        = body;

  CHECK(relay.send(frame_type::response, serialize(envelope)));
}

} // test
} // tether

#endif // TETHER_TEST_SUPPORT_HPP_
