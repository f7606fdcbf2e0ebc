#include "tether/dispatcher.hpp"

#include "tether/log.hpp"
#include "tether/error.hpp"
#include "tether/target.hpp"
#include "tether/tunnel.hpp"
#include "tether/client_session.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>

#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/empty_body.hpp>

#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;

namespace {

using state_ptr = std::shared_ptr<tether::dispatcher::state>;
using entry     = tether::dispatcher::entry;

auto target_of(tether::request_type const& request) -> std::string {
  auto const target = request.target();
  return std::string(target.data(), target.size());
}

auto write_response(
  tether::server_session  client,
  tether::response_type   response) -> tether::awaitable<void> {

  auto ec = error_code();
  co_await client.async_write(
    response, tether::redirect_error(tether::use_awaitable, ec));

  if (ec) {
    tether::log_debug("writing response to local client : " + ec.message());
  }
}

auto write_error(
  entry&                 e,
  http::status const     status,
  std::string_view const body) -> tether::awaitable<void> {

  co_await write_response(
    e.client,
    tether::make_error_response(
      status, body, e.request.version(), e.request.keep_alive()));
}

auto write_established(tether::server_session client, unsigned const version)
  -> tether::awaitable<error_code> {

  auto response = http::response<http::empty_body>(http::status::ok, version);
  response.reason("Connection Established");

  auto ec = error_code();
  co_await client.async_write(
    response, tether::redirect_error(tether::use_awaitable, ec));

  co_return ec;
}

auto watch_client(
  tether::server_session                        client,
  std::shared_ptr<tether::detail::client_watch> watch) -> tether::awaitable<void> {

  static constexpr std::size_t read_size    = 4 * 1024;
  static constexpr std::size_t max_buffered = 64 * 1024;

  auto ec      = error_code();
  auto& buffer = client.buffer();

  // whatever a waiting client pipelines stays in the session buffer for the
  // request or tunnel that consumes it later
  //
  while (!watch->stop_requested && buffer.size() < max_buffered) {
    auto const n = co_await client.stream().async_read_some(
      buffer.prepare(read_size),
      tether::redirect_error(tether::use_awaitable, ec));

    if (ec) {
      if (ec != asio::error::operation_aborted) {
        watch->gone = true;
      }
      break;
    }

    buffer.commit(n);
  }

  watch->stopped.set();
}

// ends the watch on a queued entry's client; false when the client is gone
//
auto claim_client(entry& e) -> tether::awaitable<bool> {
  if (auto const watch = e.watch) {
    watch->stop_requested = true;

    if (!watch->stopped.is_set()) {
      auto ec = error_code();
      e.client.stream().stream().cancel(ec);
      if (ec) {
        tether::log_debug("cancelling client watch : " + ec.message());
      }

      co_await watch->stopped.async_wait();
    }

    if (watch->gone) {
      co_return false;
    }
  }

  co_return e.client.stream().is_open();
}

// sends one request frame and waits for the answer attributed to it
//
auto exchange(state_ptr s, std::string const payload, error_code& ec)
  -> tether::awaitable<tether::frame> {

  auto& link = s->link;

  link.ensure_connected();
  if (!link.is_connected()) {
    co_await link.async_wait_connected(s->options.connect_wait);
  }

  if (!link.is_connected() ||
      !link.send(tether::frame_type::request, payload)) {
    ec = tether::error::relay_unavailable;
    co_return tether::frame();
  }

  auto flight = std::make_shared<tether::detail::in_flight>(s->executor);
  s->current  = flight;

  auto const answered =
    co_await flight->answered.async_wait_for(s->options.response_timeout);

  s->current.reset();

  if (!answered) {
    // the relay still owes this answer, it must not be attributed to the
    // next request
    //
    ++s->abandoned;
    ec = tether::error::response_timeout;
    co_return tether::frame();
  }

  if (flight->lost) {
    ec = tether::error::relay_connection_lost;
    co_return tether::frame();
  }

  co_return std::move(flight->answer);
}

auto handle_http(state_ptr s, entry& e) -> tether::awaitable<void> {

  auto envelope = tether::make_request_envelope(e.request);

  auto ec     = error_code();
  auto answer = co_await exchange(s, tether::serialize(envelope), ec);

  if (ec == tether::error::response_timeout) {
    tether::log_warn(
      "no answer from relay for " + envelope.method + " " + envelope.url);
    co_await write_error(e, http::status::gateway_timeout, "Gateway Timeout");
    co_return;
  }

  if (ec == tether::error::relay_unavailable) {
    tether::log_error(ec, envelope.method + " " + envelope.url);
    co_await write_error(
      e, http::status::bad_gateway, "Bad Gateway: relay unavailable");
    co_return;
  }

  if (ec == tether::error::relay_connection_lost) {
    tether::log_error(ec, envelope.method + " " + envelope.url);
    co_await write_error(
      e, http::status::bad_gateway, "Bad Gateway: relay connection lost");
    co_return;
  }

  auto const response = tether::parse_response_envelope(answer.payload, ec);
  if (ec) {
    tether::log_error(ec, "response for " + envelope.url);
    co_await write_error(e, http::status::bad_gateway, "Bad Gateway");
    co_return;
  }

  tether::log_debug(
    envelope.method + " " + envelope.url + " -> " +
    std::to_string(response.status_code));

  co_await write_response(
    e.client,
    tether::make_response(
      response, e.request.version(), e.request.keep_alive()));
}

auto direct_tunnel(state_ptr s, entry& e) -> tether::awaitable<void> {

  auto authority = target_of(e.request);
  if (authority.empty()) {
    auto const host = e.request[http::field::host];
    authority = std::string(host.data(), host.size());
  }

  auto host = std::string();
  auto port = std::string();
  if (!tether::parse_authority(authority, "443", host, port)) {
    tether::log_error(tether::error::invalid_target, authority);
    co_await write_error(e, http::status::bad_request, "Invalid CONNECT target");
    co_return;
  }

  auto ec       = error_code();
  auto upstream = tether::client_session(s->executor);

  co_await upstream.async_connect(
    host, port, tether::redirect_error(tether::use_awaitable, ec));

  if (ec) {
    tether::log_error(ec, "tunnel to " + authority);
    co_await write_error(e, http::status::bad_gateway, "Bad Gateway");
    co_return;
  }

  ec = co_await write_established(e.client, e.request.version());
  if (ec) {
    tether::log_debug("answering CONNECT : " + ec.message());
    upstream.close();
    co_return;
  }

  tether::log_debug("tunnel open to " + authority);
  co_await tether::splice(e.client, upstream);
  tether::log_debug("tunnel closed to " + authority);
}

auto send_tunnel_close(state_ptr const& s) -> void {
  if (!s->link.send(tether::frame_type::tunnel_close, "")) {
    tether::log_debug("relay link gone before the tunnel close was sent");
  }
}

auto relay_tunnel(state_ptr s, entry& e) -> tether::awaitable<void> {

  auto envelope = tether::make_request_envelope(e.request);
  if (envelope.url.empty()) {
    if (auto host = tether::find_header(envelope.headers, "Host")) {
      envelope.url = *host;
    }
  }

  auto ch         = std::make_shared<tether::detail::tunnel_channel>(e.client);
  s->tunnel       = ch;
  s->tunnel_acked = false;

  auto ec  = error_code();
  auto ack = co_await exchange(s, tether::serialize(envelope), ec);

  if (ec == tether::error::response_timeout) {
    tether::log_warn("no tunnel acknowledgment for " + envelope.url);

    // the relay may still open the tunnel once the late ack is dropped
    //
    send_tunnel_close(s);

    s->tunnel.reset();
    co_await write_error(e, http::status::gateway_timeout, "Gateway Timeout");
    co_return;
  }

  if (ec) {
    s->tunnel.reset();
    tether::log_error(ec, "tunnel to " + envelope.url);
    co_await write_error(e, http::status::bad_gateway, "Bad Gateway");
    co_return;
  }

  if (ack.payload != tether::tunnel_ack_ok) {
    s->tunnel.reset();
    tether::log_error(tether::error::tunnel_rejected, envelope.url);
    co_await write_error(e, http::status::bad_gateway, "Bad Gateway");
    co_return;
  }

  ec = co_await write_established(e.client, e.request.version());
  if (ec) {
    tether::log_debug("answering CONNECT : " + ec.message());
    if (!ch->peer_closed) {
      send_tunnel_close(s);
    }
    s->tunnel.reset();
    co_return;
  }

  tether::tunnel_establish(ch);
  tether::log_debug("relayed tunnel open to " + envelope.url);

  auto& leftover = e.client.buffer();
  if (leftover.size() > 0) {
    auto const sent = s->link.send(
      tether::frame_type::tunnel_data,
      beast::buffers_to_string(leftover.data()));

    leftover.consume(leftover.size());
    if (!sent) {
      tether::log_debug("relay link gone before pipelined tunnel bytes");
    }
  }

  auto buf = std::array<char, 16 * 1024>();

  while (!ch->peer_closed) {
    auto const n = co_await e.client.stream().async_read_some(
      asio::buffer(buf), tether::redirect_error(tether::use_awaitable, ec));

    if (ec) { break; }

    if (!s->link.send(
          tether::frame_type::tunnel_data, std::string_view(buf.data(), n))) {
      break;
    }
  }

  // the local client ended first, the relay closes its remote on our close
  //
  if (!ch->peer_closed) {
    send_tunnel_close(s);
    tether::tunnel_peer_closed(ch);
  }

  if (s->tunnel == ch) {
    s->tunnel.reset();
  }

  tether::log_debug("relayed tunnel closed to " + envelope.url);
}

auto process(state_ptr s) -> tether::awaitable<void> {

  while (!s->queue.empty()) {
    // references into the deque stay valid while new entries are appended
    //
    auto& e = s->queue.front();

    if (!co_await claim_client(e)) {
      tether::log_debug(
        "local client left before " + target_of(e.request) + " was sent");
    } else if (!e.is_tunnel) {
      co_await handle_http(s, e);
    } else if (s->options.tunnel == tether::tunnel_mode::relay) {
      co_await relay_tunnel(s, e);
    } else {
      co_await direct_tunnel(s, e);
    }

    e.done->set();
    s->queue.pop_front();
  }

  s->processing = false;
}

} // anonymous

tether::dispatcher::state::state(
  executor_type      executor_,
  relay_link         link_,
  dispatcher_options options_)
: executor(std::move(executor_))
, link(std::move(link_))
, options(std::move(options_))
{
}

tether::dispatcher::dispatcher(
  executor_type      executor,
  relay_link         link,
  dispatcher_options options)
: s_(std::make_shared<state>(
    std::move(executor), std::move(link), std::move(options)))
{
  auto weak = std::weak_ptr<state>(s_);

  s_->link.on_message(
    [weak](frame f) -> void {
      if (auto s = weak.lock()) {
        dispatcher(s).on_frame(std::move(f));
      }
    });

  s_->link.on_close(
    [weak]() -> void {
      if (auto s = weak.lock()) {
        dispatcher(s).on_link_closed();
      }
    });
}

tether::dispatcher::dispatcher(std::shared_ptr<state> s)
: s_(std::move(s))
{
}

auto tether::dispatcher::enqueue(request_type request, server_session client)
  -> std::shared_ptr<detail::async_event> {

  auto done = std::make_shared<detail::async_event>(s_->executor);
  auto const is_tunnel = request.method() == boost::beast::http::verb::connect;

  // an entry started right away needs no watch
  //
  auto watch = std::shared_ptr<detail::client_watch>();
  if (s_->processing) {
    watch = std::make_shared<detail::client_watch>(s_->executor);
    co_spawn(s_->executor, watch_client(client, watch), detached);
  }

  s_->queue.push_back(
    entry{std::move(request), std::move(client), is_tunnel, done, watch});

  if (s_->queue.size() > s_->options.queue_warn_threshold) {
    log_warn(
      "request queue is " + std::to_string(s_->queue.size()) +
      " entries long");
  }

  if (!s_->processing) {
    s_->processing = true;
    co_spawn(s_->executor, process(s_), detached);
  }

  return done;
}

auto tether::dispatcher::queue_size() const -> std::size_t {
  return s_->queue.size();
}

auto tether::dispatcher::is_processing() const -> bool {
  return s_->processing;
}

auto tether::dispatcher::abandoned() const -> std::size_t {
  return s_->abandoned;
}

auto tether::dispatcher::on_frame(frame f) -> void {

  if (f.is(frame_type::response)) {
    if (s_->abandoned > 0) {
      --s_->abandoned;
      log_warn("dropping late relay answer for a request that timed out");
      return;
    }

    auto& current = s_->current;
    if (!current || current->answered.is_set()) {
      log_warn("dropping relay answer with no request in flight");
      return;
    }

    // a tunnel waiting on its ack owns the frames that follow this answer
    //
    if (s_->tunnel) {
      s_->tunnel_acked = true;
    }

    current->answer = std::move(f);
    current->answered.set();
    return;
  }

  // tunnel frames ahead of the current tunnel's ack belong to a tunnel that
  // was already given up on
  //
  auto const tunnel_live =
    s_->tunnel && s_->tunnel_acked && s_->abandoned == 0;

  if (f.is(frame_type::tunnel_data)) {
    if (!tunnel_live) {
      log_debug("dropping tunnel data with no open tunnel");
      return;
    }

    tunnel_deliver(s_->tunnel, std::move(f.payload));
    return;
  }

  if (f.is(frame_type::tunnel_close)) {
    if (!tunnel_live) {
      log_debug("dropping tunnel close with no open tunnel");
      return;
    }

    tunnel_peer_closed(s_->tunnel);
    return;
  }

  log_debug("skipping frame of unknown type " + std::to_string(f.type));
}

auto tether::dispatcher::on_link_closed() -> void {
  // the relay discards its queue along with the connection, nothing more is
  // owed for abandoned requests
  //
  s_->abandoned = 0;

  if (s_->current && !s_->current->answered.is_set()) {
    s_->current->lost = true;
    s_->current->answered.set();
  }

  if (s_->tunnel) {
    tunnel_peer_closed(s_->tunnel);
  }
}
