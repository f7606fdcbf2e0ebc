#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/system/system_error.hpp>

#include <csignal>
#include <string>
#include <cstdlib>
#include <optional>

#include "tether/log.hpp"
#include "tether/tls.hpp"
#include "tether/config.hpp"
#include "tether/relay_server.hpp"

namespace asio = boost::asio;

using asio::ip::tcp;

int main() {
  tether::set_log_role("relay");

  auto const config = tether::relay_config::from_environment();
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

    auto server_ctx = std::optional<asio::ssl::context>();
    if (config.use_tls) {
      auto ec = boost::system::error_code();
      server_ctx.emplace(
        tether::make_server_context(config.cert_path, config.key_path, ec));

      if (ec) {
        tether::log_error(ec, "loading TLS certificate and key");
        return EXIT_FAILURE;
      }
    }

    auto options             = tether::relay_options();
    options.upstream_timeout = config.upstream_timeout;
    options.upstream_verify  = config.upstream_verify;

    auto server = tether::relay_server(
      io.get_executor(),
      tcp::endpoint(tcp::v4(), config.port),
      true,
      options,
      std::move(server_ctx));

    server.run();

    tether::log_info(
      "listening on port " + std::to_string(config.port) +
      (config.use_tls ? " with TLS" : ""));

    auto signals = asio::signal_set(io, SIGINT, SIGTERM);
    signals.async_wait(
      [&](boost::system::error_code ec, int signal) -> void {
        if (ec) { return; }

        tether::log_info("caught signal " + std::to_string(signal));
        server.close();
        io.stop();
      });

    io.run();
  } catch (boost::system::system_error const& e) {
    tether::log_error(e.code(), "relay startup");
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
