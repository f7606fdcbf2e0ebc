#ifndef TETHER_CLIENT_SESSION_HPP_
#define TETHER_CLIENT_SESSION_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <boost/asio/ssl/context.hpp>

#include <boost/system/error_code.hpp>

#include <string>

#include "tether/multi_stream.hpp"
#include "tether/detail/session.hpp"

namespace tether {

// the connecting side of a connection: the agent's link to the relay, the
// relay's calls to origin servers and both ends of a direct tunnel
//
struct client_session : public detail::session {

public:
  using timer_type  = detail::session::timer_type;
  using buffer_type = detail::session::buffer_type;
  using stream_type = detail::session::stream_type;

  // client sessions cannot be default-constructed as they require an
  // executor
  //
  client_session()                      = delete;

  client_session(client_session const&) = default;
  client_session(client_session&&)      = default;

  explicit
  client_session(boost::asio::any_io_executor const& executor);

  // when constructed with an SSL context, the `client_session` will send SNI
  // and perform an SSL handshake with the remote when calling `async_connect`
  //
  client_session(
    boost::asio::any_io_executor const& executor,
    boost::asio::ssl::context&          ctx);

  // `async_connect` performs forward name resolution on the specified host
  // and then attempts to form a TCP connection
  // `service` is the same as the original `asio::async_connect` function
  //
  // completion signature: void(error_code, tcp::endpoint)
  //
  template <typename ConnectHandler>
  auto async_connect(
    std::string      host,
    std::string      service,
    ConnectHandler&& connect_handler) &;

  // `async_request` writes a `http::request` to the remotely connected host
  // and then uses the supplied `http::response_parser` to store the response
  //
  // completion signature: void(error_code)
  //
  template <
    typename Request,
    typename ResponseParser,
    typename RequestHandler
  >
  auto async_request(
    Request&         request,
    ResponseParser&  parser,
    RequestHandler&& request_handler) &;

  // half-closes a plain TCP connection
  //
  auto shutdown(boost::system::error_code& ec) -> void;
};

} // tether

#include "tether/impl/client_session.impl.hpp"

#endif // TETHER_CLIENT_SESSION_HPP_
