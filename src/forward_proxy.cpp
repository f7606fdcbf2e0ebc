#include "tether/forward_proxy.hpp"

#include <boost/system/error_code.hpp>

#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/asio/error.hpp>

#include <string>

#include "tether/log.hpp"
#include "tether/coroutine.hpp"
#include "tether/multi_stream.hpp"
#include "tether/server_session.hpp"

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;

namespace {

auto handle_client(
  tether::multi_stream multi_stream,
  tether::dispatcher   requests) -> tether::awaitable<void> {

  auto ec          = error_code();
  auto error_token = tether::redirect_error(tether::use_awaitable, ec);

  auto session = tether::server_session(std::move(multi_stream));

  while (true) {
    http::request_parser<http::string_body>
    parser;

    // bodies are carried to the relay whole, their size is bounded only by
    // what the client sends
    //
    parser.body_limit(boost::none);

    co_await session.async_read(parser, error_token);
    if (ec) {
      if (ec != http::error::end_of_stream) {
        tether::log_debug("reading from local client : " + ec.message());
      }
      break;
    }

    auto request = parser.release();

    auto const is_connect = request.method() == http::verb::connect;
    auto const keep_alive = request.keep_alive();

    auto done = requests.enqueue(std::move(request), session);
    co_await done->async_wait();

    // after a tunnel the connection no longer speaks HTTP
    //
    if (is_connect || !keep_alive) {
      break;
    }
  }

  session.shutdown();
  session.close();
}

} // anonymous

tether::forward_proxy::state::state(
  executor_type const& executor,
  endpoint_type const& local_endpoint,
  bool const           reuse_addr,
  dispatcher           requests_)
: acceptor(executor, local_endpoint, reuse_addr)
, requests(std::move(requests_))
{
}

tether::forward_proxy::forward_proxy(
  executor_type const& executor,
  endpoint_type const& local_endpoint,
  bool const           reuse_addr,
  dispatcher           requests)
: s_(std::make_shared<state>(
    executor, local_endpoint, reuse_addr, std::move(requests)))
{
}

auto tether::forward_proxy::run() -> void {

  auto executor = s_->acceptor.get_executor();

  co_spawn(
    executor,
    [s = s_, executor]() mutable -> awaitable<void> {

      auto ec          = error_code();
      auto error_token = redirect_error(use_awaitable, ec);

      while (true) {
        auto socket = co_await s->acceptor.async_accept(error_token);
        if (ec) {
          if (ec != asio::error::operation_aborted) {
            log_error(ec, "proxy server connection acceptance");
          }
          break;
        }

        co_spawn(
          executor,
          handle_client(multi_stream(std::move(socket)), s->requests),
          detached);
      }
      co_return;
    },
    detached);
}

auto tether::forward_proxy::local_endpoint() const -> endpoint_type {
  return s_->acceptor.local_endpoint();
}

auto tether::forward_proxy::close() -> void {
  auto ec = error_code();
  s_->acceptor.close(ec);
  if (ec) {
    log_debug("closing proxy acceptor : " + ec.message());
  }
}
