#ifndef TETHER_TUNNEL_HPP_
#define TETHER_TUNNEL_HPP_

#include "tether/coroutine.hpp"
#include "tether/server_session.hpp"
#include "tether/client_session.hpp"
#include "tether/detail/session.hpp"

#include <deque>
#include <memory>
#include <string>

namespace tether {

namespace detail {

// one end of a tunnel whose bytes arrive as frames over a relay connection
//
// the bytes are written to `sink` in arrival order; nothing is written
// before the tunnel is established
//
struct tunnel_channel {
  session                 sink;
  std::deque<std::string> outbox;
  bool                    established = false;
  bool                    writing     = false;

  // the far end sent its close, `sink` is closed once `outbox` is written
  //
  bool                    peer_closed = false;

  explicit
  tunnel_channel(session sink_);
};

} // detail

auto tunnel_establish(std::shared_ptr<detail::tunnel_channel> const& ch)
  -> void;

auto tunnel_deliver(
  std::shared_ptr<detail::tunnel_channel> const& ch,
  std::string                                    bytes) -> void;

auto tunnel_peer_closed(std::shared_ptr<detail::tunnel_channel> const& ch)
  -> void;

// copies bytes from `from` to `to` until either direction fails, then closes
// both sessions
//
auto pump(detail::session from, detail::session to) -> awaitable<void>;

// joins a local client and an upstream connection byte for byte
//
// bytes the client pipelined behind its CONNECT head are forwarded first; the
// coroutine completes once both directions have stopped
//
auto splice(server_session client, client_session upstream) -> awaitable<void>;

} // tether

#endif // TETHER_TUNNEL_HPP_
