#ifndef TETHER_DETAIL_SESSION_HPP_
#define TETHER_DETAIL_SESSION_HPP_

#include "tether/detail/session_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <chrono>
#include <memory>

namespace tether {
namespace detail {

// session is a cheap, copyable handle to a stream, its read buffer and a
// timer; copies refer to the same underlying connection
//
struct session {
protected:
  std::shared_ptr<session_state> s_;

public:
  using timer_type    = session_state::timer_type;
  using buffer_type   = session_state::buffer_type;
  using stream_type   = session_state::stream_type;
  using executor_type = stream_type::executor_type;

  session()               = delete;

  session(session const&) = default;
  session(session&&)      = default;

  explicit
  session(boost::asio::any_io_executor const& executor);

  explicit
  session(stream_type stream_);

  // when constructed with an SSL context, the `session` will use the SSL side
  // of the `tether::multi_stream`
  //
  session(
    boost::asio::any_io_executor const& executor,
    boost::asio::ssl::context&          ctx);

  auto get_executor() -> executor_type;

  auto stream() & -> stream_type&;

  // bytes read from the stream but not yet consumed by a parser, e.g. the
  // start of a TLS handshake pipelined behind a CONNECT request
  //
  auto buffer() & -> buffer_type&;

  // arms the session timer; if it fires before `cancel_timeout` is called the
  // stream is closed and `timed_out` reports true
  //
  auto expires_after(std::chrono::steady_clock::duration const timeout) -> void;
  auto cancel_timeout() -> void;
  auto timed_out() const -> bool;

  auto close() -> void;

  template <
    typename Message,
    typename WriteHandler
  >
  auto
  async_write(
    Message&       message,
    WriteHandler&& write_handler) &;

  template <
    typename Parser,
    typename ReadHandler
  >
  auto
  async_read(
    Parser&       parser,
    ReadHandler&& read_handler) &;
};

} // detail
} // tether

#include "tether/impl/session.impl.hpp"

#endif // TETHER_DETAIL_SESSION_HPP_
