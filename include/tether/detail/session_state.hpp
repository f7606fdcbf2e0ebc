#ifndef TETHER_DETAIL_SESSION_STATE_HPP_
#define TETHER_DETAIL_SESSION_STATE_HPP_

#include "tether/multi_stream.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <boost/asio/ssl/context.hpp>

#include <boost/beast/core/flat_buffer.hpp>

namespace tether {
namespace detail {

struct session_state {
  using timer_type  = boost::asio::steady_timer;
  using buffer_type = boost::beast::flat_buffer;
  using stream_type = multi_stream;

  timer_type  timer;
  buffer_type buffer;
  stream_type stream;

  // set when the session timer fired and closed the stream
  //
  bool timed_out = false;

  session_state()                     = delete;
  session_state(session_state const&) = delete;
  session_state(session_state&&)      = default;

  explicit
  session_state(boost::asio::any_io_executor const& executor);

  explicit
  session_state(stream_type stream_);

  session_state(
    boost::asio::any_io_executor const& executor,
    boost::asio::ssl::context&          ctx);
};

} // detail
} // tether

#endif // TETHER_DETAIL_SESSION_STATE_HPP_
