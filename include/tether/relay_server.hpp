#ifndef TETHER_RELAY_SERVER_HPP_
#define TETHER_RELAY_SERVER_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <cstddef>
#include <optional>

namespace tether {

struct relay_options {
  std::chrono::steady_clock::duration upstream_timeout =
    std::chrono::milliseconds(20000);

  // verify origin certificates against the system trust store
  //
  bool upstream_verify = true;

  // a TLS connection that has not completed its handshake by then is
  // dropped, freeing the slot for the real agent
  //
  std::chrono::steady_clock::duration handshake_timeout =
    std::chrono::milliseconds(10000);

  std::size_t queue_warn_threshold = 100;
};

// relay_server is the remote end of the agent's one connection
//
// it serves a single agent connection at a time, refusing any other that
// arrives while one is active, and executes the requests it carries strictly
// in order against the real origin servers
//
struct relay_server {

public:
  using acceptor_type = boost::asio::ip::tcp::acceptor;
  using endpoint_type = boost::asio::ip::tcp::endpoint;
  using executor_type = boost::asio::any_io_executor;

  struct connection;

  struct state {
    acceptor_type                            acceptor;
    relay_options                            options;
    std::optional<boost::asio::ssl::context> server_ctx;
    boost::asio::ssl::context                client_ctx;

    std::shared_ptr<connection> active;
    std::size_t                 accepted = 0;
    std::size_t                 refused  = 0;

    state(
      executor_type const&                     executor,
      endpoint_type const&                     local_endpoint,
      bool const                               reuse_addr,
      relay_options const&                     options_,
      std::optional<boost::asio::ssl::context> server_ctx_);
  };

private:
  std::shared_ptr<state> s_;

public:
  relay_server()                    = delete;
  relay_server(relay_server const&) = delete;
  relay_server(relay_server&&)      = default;

  // with `server_ctx` engaged the agent connection is served over TLS
  //
  relay_server(
    executor_type const&                     executor,
    endpoint_type const&                     local_endpoint,
    bool const                               reuse_addr,
    relay_options const&                     options,
    std::optional<boost::asio::ssl::context> server_ctx = std::nullopt);

  auto run() -> void;

  auto local_endpoint() const -> endpoint_type;

  auto has_active_connection() const -> bool;

  // connections served and connections turned away while one was active
  //
  auto accepted_count() const -> std::size_t;
  auto refused_count() const  -> std::size_t;

  // stops accepting and drops the active connection
  //
  auto close() -> void;
};

} // tether

#endif // TETHER_RELAY_SERVER_HPP_
