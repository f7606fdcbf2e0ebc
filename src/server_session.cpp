#include "tether/server_session.hpp"
#include "tether/log.hpp"

tether::server_session::server_session(multi_stream stream_)
: detail::session(std::move(stream_))
{
}

auto tether::server_session::shutdown() -> void {
  auto& socket = s_->stream.stream();
  if (!socket.is_open()) { return; }

  auto ec = boost::system::error_code();
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec) {
    log_debug("server session shutdown : " + ec.message());
  }
}
