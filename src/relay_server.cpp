#include "tether/relay_server.hpp"

#include "tether/log.hpp"
#include "tether/tls.hpp"
#include "tether/error.hpp"
#include "tether/frame.hpp"
#include "tether/target.hpp"
#include "tether/tunnel.hpp"
#include "tether/envelope.hpp"
#include "tether/coroutine.hpp"
#include "tether/hop_by_hop.hpp"
#include "tether/multi_stream.hpp"
#include "tether/framed_stream.hpp"
#include "tether/client_session.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/stream_base.hpp>

#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/system/error_code.hpp>

#include <array>
#include <deque>
#include <string>

namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;

using boost::system::error_code;

struct tether::relay_server::connection {
  struct message {
    std::string payload;

    // the agent closed the tunnel this CONNECT would open before it started
    //
    bool cancelled = false;
  };

  std::optional<framed_stream> link;
  std::deque<message>          queue;
  bool                         processing = false;
  bool                         closed     = false;

  // a CONNECT is dialing its target; a close from the agent meanwhile is
  // remembered in `close_requested`
  //
  bool tunnel_connecting = false;
  bool close_requested   = false;

  std::shared_ptr<detail::tunnel_channel> tunnel;
};

namespace {

using state_ptr      = std::shared_ptr<tether::relay_server::state>;
using connection_ptr = std::shared_ptr<tether::relay_server::connection>;

auto to_string(asio::ip::tcp::endpoint const& endpoint) -> std::string {
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// the Host header value for an origin, the port only when it is not implied
// by the scheme
//
auto host_of(tether::target const& t) -> std::string {
  auto host = (t.host.find(':') != std::string::npos)
    ? "[" + t.host + "]"
    : t.host;

  auto const default_port = t.is_secure() ? "443" : "80";
  if (t.port != default_port) {
    host += ":" + t.port;
  }

  return host;
}

auto send_frame(
  connection_ptr const&  conn,
  tether::frame_type     type,
  std::string_view const payload
) -> void {

  if (!conn->link || !conn->link->send(type, payload)) {
    tether::log_debug("agent connection gone, dropping outbound frame");
  }
}

auto reply(
  connection_ptr const&            conn,
  tether::response_envelope const& response
) -> void {
  send_frame(conn, tether::frame_type::response, tether::serialize(response));
}

auto forward(state_ptr s, tether::request_envelope const& envelope)
  -> tether::awaitable<tether::response_envelope> {

  auto const host_header = tether::find_header(envelope.headers, "Host");
  auto const url         = tether::resolve_request_url(
    envelope.url, host_header ? *host_header : std::string());

  auto t = tether::target();
  if (!tether::parse_url(url, t)) {
    auto const ec = make_error_code(tether::error::invalid_target);
    tether::log_error(ec, envelope.method + " " + url);
    co_return tether::make_error_envelope(http::status::bad_gateway, ec.message());
  }

  auto executor = co_await tether::this_coro::executor;
  auto upstream = t.is_secure()
    ? tether::client_session(executor, s->client_ctx)
    : tether::client_session(executor);

  auto request = tether::request_type();
  request.method_string(envelope.method);
  request.target(t.path);
  request.version(11);

  for (auto const& [name, value] : envelope.headers) {
    request.insert(name, value);
  }

  tether::strip_hop_by_hop(request.base());

  if (request.find(http::field::host) == request.end()) {
    request.set(http::field::host, host_of(t));
  }

  request.body() = envelope.body;
  request.keep_alive(false);
  request.prepare_payload();

  http::response_parser<http::string_body>
  parser;

  parser.body_limit(boost::none);

  // a response to HEAD announces a body it never sends
  //
  if (request.method() == http::verb::head) {
    parser.skip(true);
  }

  auto ec = error_code();

  upstream.expires_after(s->options.upstream_timeout);

  co_await upstream.async_connect(
    t.host, t.port, tether::redirect_error(tether::use_awaitable, ec));

  if (!ec) {
    co_await upstream.async_request(
      request, parser, tether::redirect_error(tether::use_awaitable, ec));
  }

  upstream.cancel_timeout();
  auto const timed_out = upstream.timed_out();
  upstream.close();

  if (timed_out) {
    tether::log_error(
      tether::error::upstream_timeout, envelope.method + " " + url);

    co_return tether::make_error_envelope(
      http::status::gateway_timeout, "Gateway Timeout");
  }

  if (ec) {
    tether::log_error(ec, envelope.method + " " + url);
    co_return tether::make_error_envelope(http::status::bad_gateway, ec.message());
  }

  tether::log_debug(
    envelope.method + " " + url + " -> " +
    std::to_string(parser.get().result_int()));

  co_return tether::make_response_envelope(parser.get());
}

auto open_tunnel(
  state_ptr                       s,
  connection_ptr                  conn,
  tether::request_envelope const& envelope,
  bool const                      cancelled) -> tether::awaitable<void> {

  if (cancelled) {
    tether::log_debug("agent withdrew CONNECT " + envelope.url);
    send_frame(conn, tether::frame_type::response, tether::tunnel_ack_fail);
    co_return;
  }

  auto authority = envelope.url;
  if (authority.empty()) {
    if (auto host = tether::find_header(envelope.headers, "Host")) {
      authority = *host;
    }
  }

  auto host = std::string();
  auto port = std::string();
  if (!tether::parse_authority(authority, "443", host, port)) {
    tether::log_error(tether::error::invalid_target, "CONNECT " + authority);
    send_frame(conn, tether::frame_type::response, tether::tunnel_ack_fail);
    co_return;
  }

  auto ec       = error_code();
  auto executor = co_await tether::this_coro::executor;
  auto remote   = tether::client_session(executor);

  conn->tunnel_connecting = true;
  conn->close_requested   = false;

  remote.expires_after(s->options.upstream_timeout);
  co_await remote.async_connect(
    host, port, tether::redirect_error(tether::use_awaitable, ec));
  remote.cancel_timeout();

  conn->tunnel_connecting = false;

  if (ec) {
    tether::log_error(ec, "CONNECT " + authority);
    send_frame(conn, tether::frame_type::response, tether::tunnel_ack_fail);
    co_return;
  }

  if (conn->close_requested || conn->closed) {
    remote.close();
    send_frame(conn, tether::frame_type::response, tether::tunnel_ack_fail);
    co_return;
  }

  send_frame(conn, tether::frame_type::response, tether::tunnel_ack_ok);

  auto ch      = std::make_shared<tether::detail::tunnel_channel>(remote);
  conn->tunnel = ch;
  tether::tunnel_establish(ch);

  tether::log_debug("tunnel open to " + authority);

  auto buf = std::array<char, 16 * 1024>();

  while (!ch->peer_closed) {
    auto const n = co_await remote.stream().async_read_some(
      asio::buffer(buf), tether::redirect_error(tether::use_awaitable, ec));

    if (ec) { break; }

    if (!conn->link->send(
          tether::frame_type::tunnel_data, std::string_view(buf.data(), n))) {
      break;
    }
  }

  // the remote ended first
  //
  if (!ch->peer_closed) {
    send_frame(conn, tether::frame_type::tunnel_close, "");
    tether::tunnel_peer_closed(ch);
  }

  if (conn->tunnel == ch) {
    conn->tunnel.reset();
  }

  tether::log_debug("tunnel closed to " + authority);
}

auto handle_message(
  state_ptr                              s,
  connection_ptr                         conn,
  tether::relay_server::connection::message msg) -> tether::awaitable<void> {

  auto ec       = error_code();
  auto envelope = tether::parse_request_envelope(msg.payload, ec);

  if (ec) {
    // every request frame gets exactly one answer, the agent matches them by
    // position
    //
    tether::log_error(ec, "request from agent");
    reply(
      conn,
      tether::make_error_envelope(
        http::status::bad_gateway, "Bad Gateway: malformed envelope"));
    co_return;
  }

  if (envelope.is_connect()) {
    co_await open_tunnel(s, conn, envelope, msg.cancelled);
    co_return;
  }

  auto response = co_await forward(s, envelope);
  reply(conn, response);
}

auto work(state_ptr s, connection_ptr conn) -> tether::awaitable<void> {
  while (!conn->closed && !conn->queue.empty()) {
    auto msg = std::move(conn->queue.front());
    conn->queue.pop_front();

    co_await handle_message(s, conn, std::move(msg));
  }

  conn->processing = false;
}

auto on_frame(state_ptr const& s, connection_ptr const& conn, tether::frame f)
  -> void {

  if (f.is(tether::frame_type::request)) {
    conn->queue.push_back({std::move(f.payload)});

    if (conn->queue.size() > s->options.queue_warn_threshold) {
      tether::log_warn(
        "relay queue is " + std::to_string(conn->queue.size()) +
        " entries long");
    }

    if (!conn->processing) {
      conn->processing = true;
      tether::co_spawn(
        s->acceptor.get_executor(), work(s, conn), tether::detached);
    }
    return;
  }

  if (f.is(tether::frame_type::tunnel_data)) {
    if (!conn->tunnel) {
      tether::log_debug("dropping tunnel data with no open tunnel");
      return;
    }

    tether::tunnel_deliver(conn->tunnel, std::move(f.payload));
    return;
  }

  if (f.is(tether::frame_type::tunnel_close)) {
    if (conn->tunnel_connecting) {
      conn->close_requested = true;
      return;
    }

    if (conn->tunnel) {
      tether::tunnel_peer_closed(conn->tunnel);
      return;
    }

    // the close overtook its CONNECT, which is still queued
    //
    for (auto& msg : conn->queue) {
      if (msg.cancelled) { continue; }

      auto ec             = error_code();
      auto const envelope = tether::parse_request_envelope(msg.payload, ec);
      if (!ec && envelope.is_connect()) {
        msg.cancelled = true;
        break;
      }
    }
    return;
  }

  tether::log_debug("skipping frame of unknown type " + std::to_string(f.type));
}

auto serve(state_ptr s, connection_ptr conn, tether::multi_stream stream)
  -> tether::awaitable<void> {

  auto ec = error_code();

  if (stream.is_ssl()) {
    auto& socket  = stream.stream();
    auto deadline = asio::steady_timer(
      socket.get_executor(), s->options.handshake_timeout);

    deadline.async_wait(
      [&socket](error_code const timer_ec) -> void {
        if (timer_ec) { return; }

        tether::log_warn("agent TLS handshake timed out");

        auto close_ec = error_code();
        socket.close(close_ec);
        if (close_ec) {
          tether::log_debug("closing stalled connection : " + close_ec.message());
        }
      });

    co_await stream.ssl_stream().async_handshake(
      ssl::stream_base::server,
      tether::redirect_error(tether::use_awaitable, ec));

    deadline.cancel();

    if (ec) {
      tether::log_error(ec, "TLS handshake with agent");

      stream.close(ec);
      if (s->active == conn) {
        s->active.reset();
      }
      co_return;
    }
  }

  conn->link.emplace(std::move(stream));
  tether::log_info("agent connected");

  auto link = *conn->link;

  while (true) {
    auto f = co_await link.async_read_frame(
      tether::redirect_error(tether::use_awaitable, ec));

    if (ec) { break; }

    on_frame(s, conn, std::move(f));
  }

  if (ec == asio::error::eof) {
    tether::log_info("agent disconnected");
  } else if (!conn->closed) {
    tether::log_error(ec, "agent connection");
  }

  // queued work belongs to this connection only
  //
  conn->closed          = true;
  conn->close_requested = true;
  conn->queue.clear();

  if (conn->tunnel) {
    tether::tunnel_peer_closed(conn->tunnel);
  }

  link.close();

  if (s->active == conn) {
    s->active.reset();
  }
}

auto refuse(state_ptr const& s, asio::ip::tcp::socket socket) -> void {
  ++s->refused;

  auto ec       = error_code();
  auto const ep = socket.remote_endpoint(ec);

  tether::log_error(
    tether::error::connection_refused_busy,
    "refusing connection from " + (ec ? std::string("unknown peer") : to_string(ep)));

  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);
  if (ec) {
    tether::log_debug("closing refused connection : " + ec.message());
  }
}

auto accept_loop(state_ptr s) -> tether::awaitable<void> {

  auto ec          = error_code();
  auto error_token = tether::redirect_error(tether::use_awaitable, ec);
  auto executor    = s->acceptor.get_executor();

  while (true) {
    auto socket = co_await s->acceptor.async_accept(error_token);
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        tether::log_error(ec, "relay connection acceptance");
      }
      break;
    }

    if (s->active) {
      refuse(s, std::move(socket));
      continue;
    }

    ++s->accepted;

    auto conn = std::make_shared<tether::relay_server::connection>();
    s->active = conn;

    auto stream = s->server_ctx
      ? tether::multi_stream(std::move(socket), *s->server_ctx)
      : tether::multi_stream(std::move(socket));

    tether::co_spawn(
      executor, serve(s, conn, std::move(stream)), tether::detached);
  }
}

} // anonymous

tether::relay_server::state::state(
  executor_type const&              executor,
  endpoint_type const&              local_endpoint,
  bool const                        reuse_addr,
  relay_options const&              options_,
  std::optional<ssl::context>       server_ctx_)
: acceptor(executor, local_endpoint, reuse_addr)
, options(options_)
, server_ctx(std::move(server_ctx_))
, client_ctx(make_client_context(options_.upstream_verify))
{
}

tether::relay_server::relay_server(
  executor_type const&        executor,
  endpoint_type const&        local_endpoint,
  bool const                  reuse_addr,
  relay_options const&        options,
  std::optional<ssl::context> server_ctx)
: s_(std::make_shared<state>(
    executor, local_endpoint, reuse_addr, options, std::move(server_ctx)))
{
}

auto tether::relay_server::run() -> void {
  co_spawn(s_->acceptor.get_executor(), accept_loop(s_), detached);
}

auto tether::relay_server::local_endpoint() const -> endpoint_type {
  return s_->acceptor.local_endpoint();
}

auto tether::relay_server::has_active_connection() const -> bool {
  return static_cast<bool>(s_->active);
}

auto tether::relay_server::accepted_count() const -> std::size_t {
  return s_->accepted;
}

auto tether::relay_server::refused_count() const -> std::size_t {
  return s_->refused;
}

auto tether::relay_server::close() -> void {
  auto ec = error_code();
  s_->acceptor.close(ec);
  if (ec) {
    log_debug("closing relay acceptor : " + ec.message());
  }

  if (auto conn = s_->active) {
    conn->closed = true;
    if (conn->link) {
      conn->link->close();
    }
  }
}
