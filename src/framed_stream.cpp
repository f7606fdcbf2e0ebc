#include "tether/framed_stream.hpp"

#include "tether/log.hpp"
#include "tether/coroutine.hpp"

#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>

namespace asio = boost::asio;

using boost::system::error_code;

namespace {

auto drain(std::shared_ptr<tether::framed_stream::state> s)
  -> tether::awaitable<void> {

  auto ec = error_code();

  while (!s->closed && !s->outbox.empty()) {
    // references into a deque survive push_back, so the front element stays
    // valid while producers keep queueing behind it
    //
    auto const& bytes = s->outbox.front();

    co_await asio::async_write(
      s->stream,
      asio::buffer(bytes),
      tether::redirect_error(tether::use_awaitable, ec));

    if (ec) {
      if (!s->closed) {
        tether::log_error(ec, "framed stream write");
      }
      s->closed = true;
      s->stream.close(ec);
      break;
    }

    s->outbox.pop_front();
  }

  if (s->closed) {
    s->outbox.clear();
  }

  s->writing = false;
}

} // anonymous

tether::framed_stream::state::state(multi_stream stream_)
: stream(std::move(stream_))
{
}

tether::framed_stream::framed_stream(multi_stream stream)
: s_(std::make_shared<state>(std::move(stream)))
{
}

auto tether::framed_stream::get_executor() -> executor_type {
  return s_->stream.get_executor();
}

auto tether::framed_stream::send(
  frame_type const       type,
  std::string_view const payload
) -> bool {

  if (s_->closed) { return false; }

  s_->outbox.push_back(encode_frame(type, payload));

  if (!s_->writing) {
    s_->writing = true;
    co_spawn(s_->stream.get_executor(), drain(s_), detached);
  }

  return true;
}

auto tether::framed_stream::is_open() const -> bool {
  return !s_->closed;
}

auto tether::framed_stream::pending_writes() const -> std::size_t {
  return s_->outbox.size();
}

auto tether::framed_stream::close() -> void {
  s_->closed = true;

  // a pending write still refers to the front element, the writer clears
  // the queue once it observes the close
  //
  if (!s_->writing) {
    s_->outbox.clear();
  }

  auto ec = error_code();
  s_->stream.close(ec);
  if (ec) {
    log_debug("closing framed stream : " + ec.message());
  }
}
