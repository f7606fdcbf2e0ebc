#include "tether/detail/session.hpp"

#include <utility>

template <
  typename Message,
  typename WriteHandler
>
auto
tether::detail::session::async_write(
  Message&       message,
  WriteHandler&& write_handler
) & {
  return boost::beast::http::async_write(
    s_->stream, message, std::forward<WriteHandler>(write_handler));
}

template <
  typename Parser,
  typename ReadHandler
>
auto
tether::detail::session::async_read(
  Parser&       parser,
  ReadHandler&& read_handler
) & {
  return boost::beast::http::async_read(
    s_->stream,
    s_->buffer,
    parser,
    std::forward<ReadHandler>(read_handler));
}
