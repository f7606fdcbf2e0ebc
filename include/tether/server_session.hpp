#ifndef TETHER_SERVER_SESSION_HPP_
#define TETHER_SERVER_SESSION_HPP_

#include "tether/multi_stream.hpp"
#include "tether/detail/session.hpp"

namespace tether {

// the accepted side of a connection, e.g. a local client talking to the proxy
//
struct server_session : public detail::session {

public:
  using timer_type  = detail::session::timer_type;
  using buffer_type = detail::session::buffer_type;
  using stream_type = detail::session::stream_type;

  server_session()                      = delete;
  server_session(server_session const&) = default;
  server_session(server_session&&)      = default;

  explicit
  server_session(multi_stream stream);

  // half-closes the connection, signalling end-of-stream to the peer
  //
  auto shutdown() -> void;
};

} // tether

#endif // TETHER_SERVER_SESSION_HPP_
