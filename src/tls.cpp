#include "tether/tls.hpp"
#include "tether/log.hpp"

namespace ssl = boost::asio::ssl;

using boost::system::error_code;

auto tether::make_client_context(bool const verify) -> ssl::context {
  auto ctx = ssl::context(ssl::context::tls_client);

  if (!verify) {
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
  }

  auto ec = error_code();
  ctx.set_default_verify_paths(ec);
  if (ec) {
    log_error(ec, "loading system trust store");
  }
  ctx.set_verify_mode(ssl::verify_peer);

  return ctx;
}

auto tether::make_server_context(
  std::string const& cert_path,
  std::string const& key_path,
  error_code&        ec
) -> ssl::context {

  auto ctx = ssl::context(ssl::context::tls_server);

  ctx.set_options(
    ssl::context::default_workarounds |
    ssl::context::no_sslv2 |
    ssl::context::no_sslv3);

  ctx.use_certificate_chain_file(cert_path, ec);
  if (ec) { return ctx; }

  ctx.use_private_key_file(key_path, ssl::context::pem, ec);
  return ctx;
}
