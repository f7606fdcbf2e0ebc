#ifndef TETHER_TLS_HPP_
#define TETHER_TLS_HPP_

#include <boost/asio/ssl/context.hpp>
#include <boost/system/error_code.hpp>

#include <string>

namespace tether {

// client context for outbound TLS
//
// with `verify` set, peer certificates are checked against the system trust
// store; the host name itself is checked by `client_session::async_connect`
//
auto make_client_context(bool const verify) -> boost::asio::ssl::context;

// server context for the relay listener, loaded from PEM files
//
auto make_server_context(
  std::string const&         cert_path,
  std::string const&         key_path,
  boost::system::error_code& ec) -> boost::asio::ssl::context;

} // tether

#endif // TETHER_TLS_HPP_
