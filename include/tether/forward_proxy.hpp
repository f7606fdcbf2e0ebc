#ifndef TETHER_FORWARD_PROXY_HPP_
#define TETHER_FORWARD_PROXY_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "tether/dispatcher.hpp"

namespace tether {

// forward_proxy is the HTTP proxy local clients talk to
//
// every request read from a client connection is handed to the dispatcher
// and the next one is only read once it has been answered
//
struct forward_proxy {

public:
  using acceptor_type = boost::asio::ip::tcp::acceptor;
  using endpoint_type = boost::asio::ip::tcp::endpoint;
  using executor_type = boost::asio::any_io_executor;

private:
  struct state {
    acceptor_type acceptor;
    dispatcher    requests;

    state()             = delete;
    state(state const&) = delete;
    state(state&&)      = default;

    state(
      executor_type const& executor,
      endpoint_type const& local_endpoint,
      bool const           reuse_addr,
      dispatcher           requests_);
  };

  std::shared_ptr<state> s_;

public:
  forward_proxy()                     = delete;
  forward_proxy(forward_proxy const&) = delete;
  forward_proxy(forward_proxy&&)      = default;

  forward_proxy(
    executor_type const& executor,
    endpoint_type const& local_endpoint,
    bool const           reuse_addr,
    dispatcher           requests);

  auto run() -> void;

  // the bound address, useful when listening on port 0
  //
  auto local_endpoint() const -> endpoint_type;

  // stops accepting; connections already accepted run to completion
  //
  auto close() -> void;
};

} // tether

#endif // TETHER_FORWARD_PROXY_HPP_
