#ifndef TETHER_MULTI_STREAM_HPP_
#define TETHER_MULTI_STREAM_HPP_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/context.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <boost/system/error_code.hpp>

#include <utility>
#include <optional>

namespace tether {

// multi_stream is a dual-stream type that optionally supports TLS/SSL stream
// operations
//
// exactly one of the plain or the TLS stream is engaged for the lifetime of
// the object; when TLS is engaged the TCP socket is its next layer
//
// multi_stream meets the requirements of AsyncStream
//
struct multi_stream {

public:
  using stream_type     = boost::asio::ip::tcp::socket;
  using ssl_stream_type = boost::asio::ssl::stream<stream_type>;
  using executor_type   = stream_type::executor_type;

private:
  std::optional<stream_type>     stream_;
  std::optional<ssl_stream_type> ssl_stream_;

public:
  multi_stream()                    = delete;
  multi_stream(multi_stream const&) = delete;
  multi_stream(multi_stream&&)      = default;

  explicit
  multi_stream(executor_type const& executor);

  multi_stream(executor_type const& executor, boost::asio::ssl::context& ctx);

  // adopt an already connected socket, e.g. one handed out by an acceptor
  //
  explicit
  multi_stream(stream_type socket);

  multi_stream(stream_type socket, boost::asio::ssl::context& ctx);

  auto get_executor() -> executor_type;

  template <
    typename MutableBufferSequence,
    typename ReadHandler
  >
  auto async_read_some(
    MutableBufferSequence const& buffers,
    ReadHandler&&                handler
  ) {
    if (is_ssl()) {
      return ssl_stream_->async_read_some(
        buffers, std::forward<ReadHandler>(handler));
    }
    return stream_->async_read_some(buffers, std::forward<ReadHandler>(handler));
  }

  template<
    typename ConstBufferSequence,
    typename WriteHandler
  >
  auto async_write_some(
    ConstBufferSequence const& buffers,
    WriteHandler&&             handler
  ) {
    if (is_ssl()) {
      return ssl_stream_->async_write_some(
        buffers, std::forward<WriteHandler>(handler));
    }
    return stream_->async_write_some(
      buffers, std::forward<WriteHandler>(handler));
  }

  auto is_ssl() const -> bool;
  auto is_open() const -> bool;

  // the TCP socket, regardless of whether TLS is layered on top of it
  //
  auto stream() &     -> stream_type&;
  auto ssl_stream() & -> ssl_stream_type&;

  // closes the underlying socket, cancelling any pending operations
  //
  auto close(boost::system::error_code& ec) -> void;
};

} // tether

#endif // TETHER_MULTI_STREAM_HPP_
