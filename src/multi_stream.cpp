#include "tether/multi_stream.hpp"

tether::multi_stream::multi_stream(executor_type const& executor)
: stream_(std::in_place, executor)
{
}

tether::multi_stream::multi_stream(
  executor_type const&       executor,
  boost::asio::ssl::context& ctx)
: ssl_stream_(std::in_place, executor, ctx)
{
}

tether::multi_stream::multi_stream(stream_type socket)
: stream_(std::in_place, std::move(socket))
{
}

tether::multi_stream::multi_stream(
  stream_type                socket,
  boost::asio::ssl::context& ctx)
: ssl_stream_(std::in_place, std::move(socket), ctx)
{
}

auto tether::multi_stream::get_executor() -> executor_type {
  if (is_ssl()) {
    return ssl_stream_->get_executor();
  }
  return stream_->get_executor();
}

auto tether::multi_stream::is_ssl() const -> bool {
  return ssl_stream_.has_value();
}

auto tether::multi_stream::is_open() const -> bool {
  if (is_ssl()) {
    return ssl_stream_->next_layer().is_open();
  }
  return stream_->is_open();
}

auto tether::multi_stream::stream() & -> stream_type& {
  if (is_ssl()) {
    return ssl_stream_->next_layer();
  }
  return *stream_;
}

auto tether::multi_stream::ssl_stream() & -> ssl_stream_type& {
  return *ssl_stream_;
}

auto tether::multi_stream::close(boost::system::error_code& ec) -> void {
  auto& socket = stream();
  if (!socket.is_open()) { return; }

  // shutdown reports ENOTCONN for sockets the peer already dropped, only the
  // result of close is of interest to callers
  //
  socket.shutdown(stream_type::shutdown_both, ec);
  socket.close(ec);
}
