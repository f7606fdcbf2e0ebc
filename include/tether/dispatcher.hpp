#ifndef TETHER_DISPATCHER_HPP_
#define TETHER_DISPATCHER_HPP_

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <cstddef>

#include "tether/frame.hpp"
#include "tether/config.hpp"
#include "tether/envelope.hpp"
#include "tether/coroutine.hpp"
#include "tether/relay_link.hpp"
#include "tether/tunnel.hpp"
#include "tether/server_session.hpp"
#include "tether/detail/signal.hpp"

namespace tether {

struct dispatcher_options {
  std::chrono::steady_clock::duration response_timeout =
    std::chrono::milliseconds(20000);

  // how long a request waits for a connect that is already underway
  //
  std::chrono::steady_clock::duration connect_wait =
    std::chrono::milliseconds(200);

  tunnel_mode tunnel               = tunnel_mode::direct;
  std::size_t queue_warn_threshold = 100;
};

namespace detail {

// the request currently awaiting its answer from the relay
//
struct in_flight {
  async_event answered;
  frame       answer;

  // the relay connection dropped before an answer arrived
  //
  bool lost = false;

  explicit
  in_flight(boost::asio::any_io_executor executor)
  : answered(std::move(executor))
  {
  }
};

// keeps reading from the client of a queued entry until the entry's turn
// comes, so a client that hangs up is noticed before its request is sent
//
struct client_watch {
  async_event stopped;
  bool        stop_requested = false;

  // the client closed its connection while the entry was queued
  //
  bool gone = false;

  explicit
  client_watch(boost::asio::any_io_executor executor)
  : stopped(std::move(executor))
  {
  }
};

} // detail

// dispatcher is the agent's single request queue
//
// entries are served strictly one at a time in arrival order; the answer to
// a request is whichever response frame the relay sends next, so at most one
// request is ever outstanding on the relay link
//
struct dispatcher {

public:
  using executor_type = boost::asio::any_io_executor;

  struct entry {
    request_type                        request;
    server_session                      client;
    bool                                 is_tunnel = false;
    std::shared_ptr<detail::async_event>  done;

    // engaged only for entries that had to wait behind another
    //
    std::shared_ptr<detail::client_watch> watch;
  };

  struct state {
    executor_type      executor;
    relay_link         link;
    dispatcher_options options;

    std::deque<entry>                       queue;
    bool                                    processing = false;
    std::shared_ptr<detail::in_flight>      current;
    std::shared_ptr<detail::tunnel_channel> tunnel;

    // set once the relay's acknowledgment for `tunnel` was matched; tunnel
    // frames are delivered only after that
    //
    bool tunnel_acked = false;

    // answers still owed by the relay for requests that already timed out
    //
    std::size_t abandoned = 0;

    state(executor_type executor_, relay_link link_, dispatcher_options options_);
  };

private:
  std::shared_ptr<state> s_;

  explicit
  dispatcher(std::shared_ptr<state> s);

public:
  dispatcher()                  = delete;
  dispatcher(dispatcher const&) = default;
  dispatcher(dispatcher&&)      = default;

  // installs the frame and close handlers on `link`
  //
  dispatcher(executor_type executor, relay_link link, dispatcher_options options);

  // queues a request read from `client`; the returned event is set once the
  // request has been fully answered, including the lifetime of a tunnel, or
  // once it was discarded because the client hung up while it was queued
  //
  auto enqueue(request_type request, server_session client)
    -> std::shared_ptr<detail::async_event>;

  auto queue_size() const    -> std::size_t;
  auto is_processing() const -> bool;
  auto abandoned() const     -> std::size_t;

  // entry points for the relay link, public for tests
  //
  auto on_frame(frame f) -> void;
  auto on_link_closed()  -> void;
};

} // tether

#endif // TETHER_DISPATCHER_HPP_
