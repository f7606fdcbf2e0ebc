#include "tether/tunnel.hpp"

#include "tether/log.hpp"
#include "tether/detail/signal.hpp"

#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>

#include <boost/system/error_code.hpp>

#include <array>
#include <memory>

namespace asio = boost::asio;

using boost::system::error_code;

namespace {

struct splice_state {
  tether::detail::async_event finished;
  int                         running = 2;

  explicit
  splice_state(asio::any_io_executor executor)
  : finished(std::move(executor))
  {
  }
};

auto pump_then_signal(
  tether::detail::session       from,
  tether::detail::session       to,
  std::shared_ptr<splice_state> st) -> tether::awaitable<void> {

  co_await tether::pump(from, to);

  if (--st->running == 0) {
    st->finished.set();
  }
}

auto drain(std::shared_ptr<tether::detail::tunnel_channel> ch)
  -> tether::awaitable<void> {

  auto ec = error_code();

  while (!ch->outbox.empty()) {
    auto const& bytes = ch->outbox.front();

    co_await asio::async_write(
      ch->sink.stream(),
      asio::buffer(bytes),
      tether::redirect_error(tether::use_awaitable, ec));

    if (ec) { break; }
    ch->outbox.pop_front();
  }

  ch->outbox.clear();
  ch->writing = false;

  if (ec) {
    tether::log_debug("writing tunnel bytes : " + ec.message());
  }

  if (ec || ch->peer_closed) {
    ch->sink.close();
  }
}

auto start_drain(std::shared_ptr<tether::detail::tunnel_channel> const& ch)
  -> void {

  if (!ch->established || ch->writing) { return; }

  if (ch->outbox.empty()) {
    if (ch->peer_closed) { ch->sink.close(); }
    return;
  }

  ch->writing = true;
  tether::co_spawn(ch->sink.get_executor(), drain(ch), tether::detached);
}

} // anonymous

tether::detail::tunnel_channel::tunnel_channel(session sink_)
: sink(std::move(sink_))
{
}

auto tether::tunnel_establish(
  std::shared_ptr<detail::tunnel_channel> const& ch
) -> void {
  ch->established = true;
  start_drain(ch);
}

auto tether::tunnel_deliver(
  std::shared_ptr<detail::tunnel_channel> const& ch,
  std::string                                    bytes
) -> void {
  if (ch->peer_closed) { return; }

  ch->outbox.push_back(std::move(bytes));
  start_drain(ch);
}

auto tether::tunnel_peer_closed(
  std::shared_ptr<detail::tunnel_channel> const& ch
) -> void {
  ch->peer_closed = true;
  start_drain(ch);
}

auto tether::pump(detail::session from, detail::session to)
  -> awaitable<void> {

  auto ec          = error_code();
  auto error_token = redirect_error(use_awaitable, ec);

  auto buf = std::array<char, 2048>();

  while (true) {
    auto const n = co_await from.stream().async_read_some(
      asio::buffer(buf), error_token);

    if (ec) { break; }

    co_await asio::async_write(
      to.stream(), asio::buffer(buf.data(), n), error_token);

    if (ec) { break; }
  }

  if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
    log_debug("tunnel pump stopped : " + ec.message());
  }

  from.close();
  to.close();
}

auto tether::splice(server_session client, client_session upstream)
  -> awaitable<void> {

  auto ec = error_code();

  auto& leftover = client.buffer();
  if (leftover.size() > 0) {
    co_await asio::async_write(
      upstream.stream(),
      leftover.data(),
      redirect_error(use_awaitable, ec));

    leftover.consume(leftover.size());

    if (ec) {
      log_debug("forwarding pipelined tunnel bytes : " + ec.message());
      client.close();
      upstream.close();
      co_return;
    }
  }

  auto executor = co_await this_coro::executor;
  auto st       = std::make_shared<splice_state>(executor);

  co_spawn(executor, pump_then_signal(client, upstream, st), detached);
  co_spawn(executor, pump_then_signal(upstream, client, st), detached);

  co_await st->finished.async_wait();
}
