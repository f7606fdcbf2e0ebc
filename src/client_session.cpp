#include "tether/client_session.hpp"

tether::client_session::client_session(
  boost::asio::any_io_executor const& executor)
: detail::session(executor)
{
}

tether::client_session::client_session(
  boost::asio::any_io_executor const& executor,
  boost::asio::ssl::context&          ctx)
: detail::session(executor, ctx)
{
}

auto tether::client_session::shutdown(boost::system::error_code& ec) -> void {
  auto& multi_stream = s_->stream;

  multi_stream
    .stream()
    .shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}
