#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <boost/system/system_error.hpp>

#include <csignal>
#include <string>
#include <cstdlib>

#include "tether/log.hpp"
#include "tether/config.hpp"
#include "tether/dispatcher.hpp"
#include "tether/relay_link.hpp"
#include "tether/forward_proxy.hpp"

namespace asio = boost::asio;

using asio::ip::tcp;

int main() {
  tether::set_log_role("agent");

  auto const config = tether::agent_config::from_environment();
  tether::set_debug_logging(config.debug);

  auto const problems = config.validate();
  if (!problems.empty()) {
    for (auto const& problem : problems) {
      tether::log_error("configuration: " + problem);
    }
    return EXIT_FAILURE;
  }

  try {
    auto io = asio::io_context();

    auto link_opts               = tether::link_options();
    link_opts.host               = config.relay_host;
    link_opts.port               = config.relay_port;
    link_opts.use_tls            = config.use_tls;
    link_opts.reconnect_interval = config.reconnect_interval;

    auto link = tether::relay_link(io.get_executor(), link_opts);

    auto dispatch_opts             = tether::dispatcher_options();
    dispatch_opts.response_timeout = config.response_timeout;
    dispatch_opts.connect_wait     = config.connect_wait;
    dispatch_opts.tunnel           = config.tunnel;

    auto requests = tether::dispatcher(io.get_executor(), link, dispatch_opts);

    auto proxy = tether::forward_proxy(
      io.get_executor(),
      tcp::endpoint(tcp::v4(), config.local_port),
      true,
      requests);

    proxy.run();

    // connect eagerly so the first request does not pay for the handshake
    //
    link.ensure_connected();

    tether::log_info(
      "listening on port " + std::to_string(config.local_port) +
      ", relay " + config.relay_host + ":" + config.relay_port +
      (config.use_tls ? " over TLS" : ""));

    auto signals = asio::signal_set(io, SIGINT, SIGTERM);
    signals.async_wait(
      [&](boost::system::error_code ec, int signal) -> void {
        if (ec) { return; }

        tether::log_info("caught signal " + std::to_string(signal));
        proxy.close();
        link.close();
        io.stop();
      });

    io.run();
  } catch (boost::system::system_error const& e) {
    tether::log_error(e.code(), "agent startup");
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
