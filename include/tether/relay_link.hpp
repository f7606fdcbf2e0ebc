#ifndef TETHER_RELAY_LINK_HPP_
#define TETHER_RELAY_LINK_HPP_

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <cstddef>
#include <optional>
#include <functional>
#include <string_view>

#include "tether/frame.hpp"
#include "tether/coroutine.hpp"
#include "tether/framed_stream.hpp"
#include "tether/detail/signal.hpp"

namespace tether {

struct link_options {
  std::string host = "localhost";
  std::string port = "9999";
  bool        use_tls = false;

  std::chrono::steady_clock::duration reconnect_interval =
    std::chrono::milliseconds(5000);
};

// relay_link owns the agent's one connection to the relay
//
// it is the only place a connection to the relay is created or destroyed; at
// most one exists at any time and a lost connection is retried forever at a
// fixed interval
//
struct relay_link {

public:
  using executor_type   = boost::asio::any_io_executor;
  using message_handler = std::function<void(frame)>;
  using close_handler   = std::function<void()>;

  struct state {
    executor_type               executor;
    link_options                options;
    boost::asio::ssl::context   ctx;
    std::optional<framed_stream> link;

    boost::asio::steady_timer   reconnect_timer;
    std::size_t                 reconnect_ticket = 0;
    bool                        reconnect_pending = false;

    // set whenever a connect attempt settles, either way
    //
    detail::async_event         settled;

    bool                        connecting  = false;
    bool                        stopped     = false;
    std::size_t                 generation  = 0;
    std::size_t                 connects    = 0;

    message_handler             on_message;
    close_handler               on_close;

    state(executor_type executor_, link_options options_);
  };

private:
  std::shared_ptr<state> s_;

public:
  relay_link()                  = delete;
  relay_link(relay_link const&) = default;
  relay_link(relay_link&&)      = default;

  relay_link(executor_type executor, link_options options);

  // every inbound frame, in arrival order
  //
  auto on_message(message_handler handler) -> void;

  // fires once per lost connection, before a reconnect is scheduled
  //
  auto on_close(close_handler handler) -> void;

  // starts a connect unless a connection is live or one is underway
  //
  auto ensure_connected() -> void;

  auto is_connected() const      -> bool;
  auto is_connecting() const     -> bool;
  auto reconnect_pending() const -> bool;

  // number of connections established over the lifetime of the link
  //
  auto connect_count() const -> std::size_t;

  // waits up to `timeout` for an in-progress connect to settle and reports
  // whether a connection is live afterwards
  //
  auto async_wait_connected(std::chrono::steady_clock::duration const timeout)
    -> awaitable<bool>;

  // queues a frame on the live connection; false when there is none
  //
  auto send(frame_type const type, std::string_view const payload) -> bool;

  // tears the connection down for good, no reconnect follows
  //
  auto close() -> void;
};

} // tether

#endif // TETHER_RELAY_LINK_HPP_
