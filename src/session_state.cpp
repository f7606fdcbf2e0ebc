#include "tether/detail/session_state.hpp"

tether::detail::session_state::session_state(
  boost::asio::any_io_executor const& executor)
: timer(executor)
, stream(executor)
{
}

tether::detail::session_state::session_state(
  boost::asio::any_io_executor const& executor,
  boost::asio::ssl::context&          ctx)
: timer(executor)
, stream(executor, ctx)
{
}

tether::detail::session_state::session_state(stream_type stream_)
: timer(stream_.get_executor())
, stream(std::move(stream_))
{
}
