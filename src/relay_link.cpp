#include "tether/relay_link.hpp"

#include "tether/log.hpp"
#include "tether/tls.hpp"
#include "tether/client_session.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

using boost::system::error_code;

namespace {

using state_ptr = std::shared_ptr<tether::relay_link::state>;

auto connect(state_ptr s) -> tether::awaitable<void>;

auto relay_address(state_ptr const& s) -> std::string {
  return s->options.host + ":" + s->options.port;
}

auto start_connect(state_ptr const& s) -> void {
  if (s->stopped || s->link || s->connecting) { return; }

  s->connecting = true;
  s->settled.reset();

  tether::co_spawn(s->executor, connect(s), tether::detached);
}

auto schedule_reconnect(state_ptr const& s) -> void {
  if (s->stopped || s->reconnect_pending) { return; }

  s->reconnect_pending = true;
  auto const ticket = ++s->reconnect_ticket;

  tether::log_info(
    "reconnecting to relay in " +
    std::to_string(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        s->options.reconnect_interval).count()) +
    "ms");

  s->reconnect_timer.expires_after(s->options.reconnect_interval);
  s->reconnect_timer.async_wait(
    [s, ticket](error_code ec) -> void {
      // a newer schedule or a successful connect owns the flag now
      if (ticket != s->reconnect_ticket) { return; }

      s->reconnect_pending = false;
      if (ec || s->stopped) { return; }

      start_connect(s);
    });
}

auto cancel_reconnect(state_ptr const& s) -> void {
  ++s->reconnect_ticket;
  s->reconnect_pending = false;
  s->reconnect_timer.cancel();
}

auto read_loop(state_ptr s, tether::framed_stream link, std::size_t generation)
  -> tether::awaitable<void> {

  auto ec = error_code();

  while (true) {
    auto f = co_await link.async_read_frame(
      tether::redirect_error(tether::use_awaitable, ec));

    if (ec) { break; }

    // the handler may tear the link down from under us
    //
    if (generation != s->generation || !s->link) { co_return; }

    if (s->on_message) {
      s->on_message(std::move(f));
    }
  }

  link.close();

  // a newer connection or an explicit close already took over
  //
  if (generation != s->generation || !s->link) { co_return; }

  if (ec == boost::asio::error::eof) {
    tether::log_warn("relay closed the connection");
  } else {
    tether::log_error(ec, "relay connection");
  }

  s->link.reset();

  if (s->on_close) {
    s->on_close();
  }

  schedule_reconnect(s);
}

auto connect(state_ptr s) -> tether::awaitable<void> {

  auto session = s->options.use_tls
    ? tether::client_session(s->executor, s->ctx)
    : tether::client_session(s->executor);

  tether::log_debug("connecting to relay " + relay_address(s));

  auto ec = error_code();
  co_await session.async_connect(
    s->options.host,
    s->options.port,
    tether::redirect_error(tether::use_awaitable, ec));

  s->connecting = false;

  if (s->stopped) {
    session.close();
    s->settled.set();
    co_return;
  }

  if (ec) {
    tether::log_error(ec, "connecting to relay " + relay_address(s));
    s->settled.set();
    schedule_reconnect(s);
    co_return;
  }

  cancel_reconnect(s);

  ++s->connects;
  auto const generation = ++s->generation;

  s->link.emplace(std::move(session.stream()));

  tether::log_info("connected to relay " + relay_address(s));
  s->settled.set();

  tether::co_spawn(
    s->executor, read_loop(s, *s->link, generation), tether::detached);
}

} // anonymous

tether::relay_link::state::state(
  executor_type executor_,
  link_options  options_)
: executor(std::move(executor_))
, options(std::move(options_))
, ctx(make_client_context(false))
, reconnect_timer(executor)
, settled(executor)
{
}

tether::relay_link::relay_link(
  executor_type executor,
  link_options  options)
: s_(std::make_shared<state>(std::move(executor), std::move(options)))
{
}

auto tether::relay_link::on_message(message_handler handler) -> void {
  s_->on_message = std::move(handler);
}

auto tether::relay_link::on_close(close_handler handler) -> void {
  s_->on_close = std::move(handler);
}

auto tether::relay_link::ensure_connected() -> void {
  start_connect(s_);
}

auto tether::relay_link::is_connected() const -> bool {
  return s_->link.has_value() && s_->link->is_open();
}

auto tether::relay_link::is_connecting() const -> bool {
  return s_->connecting;
}

auto tether::relay_link::reconnect_pending() const -> bool {
  return s_->reconnect_pending;
}

auto tether::relay_link::connect_count() const -> std::size_t {
  return s_->connects;
}

auto tether::relay_link::async_wait_connected(
  std::chrono::steady_clock::duration const timeout
) -> awaitable<bool> {

  auto s = s_;
  if (s->connecting) {
    co_await s->settled.async_wait_for(timeout);
  }

  co_return s->link.has_value() && s->link->is_open();
}

auto tether::relay_link::send(
  frame_type const       type,
  std::string_view const payload
) -> bool {

  if (!s_->link) { return false; }
  return s_->link->send(type, payload);
}

auto tether::relay_link::close() -> void {
  s_->stopped = true;
  cancel_reconnect(s_);

  if (s_->link) {
    s_->link->close();
    s_->link.reset();
  }
}
