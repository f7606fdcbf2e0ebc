#ifndef TETHER_COROUTINE_HPP_
#define TETHER_COROUTINE_HPP_

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/any_io_executor.hpp>

namespace tether {

// the coroutine vocabulary used throughout tether
//
// every async operation in the library is awaited with
// `redirect_error(use_awaitable, ec)` so that failures come back as
// `boost::system::error_code` values instead of exceptions
//
template <typename T, typename Executor = boost::asio::any_io_executor>
using awaitable = boost::asio::awaitable<T, Executor>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

namespace this_coro = boost::asio::this_coro;

} // tether

#endif // TETHER_COROUTINE_HPP_
