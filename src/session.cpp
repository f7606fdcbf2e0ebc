#include "tether/detail/session.hpp"
#include "tether/log.hpp"

tether::detail::session::session(
  boost::asio::any_io_executor const& executor)
: s_(std::make_shared<session_state>(executor))
{
}

tether::detail::session::session(
  boost::asio::any_io_executor const& executor,
  boost::asio::ssl::context&          ctx)
: s_(std::make_shared<session_state>(executor, ctx))
{
}

tether::detail::session::session(stream_type stream_)
: s_(std::make_shared<session_state>(std::move(stream_)))
{
}

auto tether::detail::session::get_executor() -> executor_type {
  return s_->stream.get_executor();
}

auto tether::detail::session::stream() & -> stream_type& {
  return s_->stream;
}

auto tether::detail::session::buffer() & -> buffer_type& {
  return s_->buffer;
}

auto tether::detail::session::expires_after(
  std::chrono::steady_clock::duration const timeout
) -> void {

  s_->timed_out = false;
  s_->timer.expires_after(timeout);
  s_->timer.async_wait(
    [s = s_](boost::system::error_code ec) -> void {
      // cancelled or re-armed
      if (ec) { return; }

      s->timed_out = true;
      s->stream.close(ec);
    });
}

auto tether::detail::session::cancel_timeout() -> void {
  s_->timer.cancel();
}

auto tether::detail::session::timed_out() const -> bool {
  return s_->timed_out;
}

auto tether::detail::session::close() -> void {
  auto ec = boost::system::error_code();
  s_->stream.close(ec);
  if (ec) {
    log_debug("closing session stream : " + ec.message());
  }
}
