#ifndef TETHER_FRAMED_STREAM_HPP_
#define TETHER_FRAMED_STREAM_HPP_

#include <boost/asio/post.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/coroutine.hpp>

#include <boost/beast/core/flat_buffer.hpp>

#include <boost/system/error_code.hpp>

#include <deque>
#include <memory>
#include <string>
#include <optional>
#include <string_view>

#include "tether/frame.hpp"
#include "tether/multi_stream.hpp"

namespace tether {

// framed_stream turns a byte stream into a duplex channel of frames
//
// reads are driven by the owner through `async_read_frame`, one at a time;
// writes are queued by `send` and drained in order by a single writer so
// frames from different producers are never interleaved on the wire
//
// copies refer to the same underlying connection
//
struct framed_stream {

public:
  using executor_type = multi_stream::executor_type;

  struct state {
    multi_stream              stream;
    boost::beast::flat_buffer buffer;
    std::deque<std::string>   outbox;
    bool                      writing = false;
    bool                      closed  = false;

    explicit
    state(multi_stream stream_);
  };

private:
  std::shared_ptr<state> s_;

public:
  framed_stream()                     = delete;
  framed_stream(framed_stream const&) = default;
  framed_stream(framed_stream&&)      = default;

  explicit
  framed_stream(multi_stream stream);

  auto get_executor() -> executor_type;

  // completion signature: void(error_code, frame)
  //
  template <typename ReadHandler>
  auto async_read_frame(ReadHandler&& handler) &;

  // queues one frame for writing; returns false once the stream is closed
  //
  auto send(frame_type const type, std::string_view const payload) -> bool;

  auto is_open() const -> bool;
  auto pending_writes() const -> std::size_t;

  auto close() -> void;
};

namespace detail {

struct async_read_frame_op : public boost::asio::coroutine {

  static constexpr std::size_t read_size = 16 * 1024;

  std::shared_ptr<framed_stream::state> s;
  std::optional<frame>                  decoded;

  explicit
  async_read_frame_op(std::shared_ptr<framed_stream::state> s_)
  : s(std::move(s_))
  {
  }

  #include <boost/asio/yield.hpp>
  template <typename Self>
  auto operator()(
    Self&                     self,
    boost::system::error_code ec                = {},
    std::size_t               bytes_transferred = 0) -> void {

    reenter(*this) {
      yield boost::asio::post(s->stream.get_executor(), std::move(self));

      while (!(decoded = decode_frame(s->buffer))) {
        yield s->stream.async_read_some(
          s->buffer.prepare(read_size), std::move(self));

        if (ec) {
          return self.complete(ec, frame());
        }

        s->buffer.commit(bytes_transferred);
      }

      self.complete({}, std::move(*decoded));
    }
  }
  #include <boost/asio/unyield.hpp>
};

} // detail

template <typename ReadHandler>
auto framed_stream::async_read_frame(ReadHandler&& handler) & {
  return boost::asio::async_compose<
    ReadHandler, void(boost::system::error_code, frame)
  >(
    detail::async_read_frame_op(s_),
    handler,
    s_->stream);
}

} // tether

#endif // TETHER_FRAMED_STREAM_HPP_
