#ifndef TETHER_DETAIL_SIGNAL_HPP_
#define TETHER_DETAIL_SIGNAL_HPP_

#include "tether/coroutine.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace tether {
namespace detail {

// async_event is a one-shot signal for coroutines on the same executor
//
// any number of coroutines may wait; `set` wakes all of them and every wait
// started afterwards completes immediately until `reset` is called
//
struct async_event {

public:
  using timer_type    = boost::asio::steady_timer;
  using executor_type = boost::asio::any_io_executor;
  using duration_type = std::chrono::steady_clock::duration;

private:
  executor_type                            executor_;
  std::vector<std::shared_ptr<timer_type>> waiters_;
  bool                                     set_ = false;

  auto wait_until_set(std::shared_ptr<timer_type> waiter) -> awaitable<void>;

public:
  async_event()                   = delete;
  async_event(async_event const&) = delete;
  async_event(async_event&&)      = default;

  explicit
  async_event(executor_type executor);

  auto set()    -> void;
  auto reset()  -> void;
  auto is_set() const -> bool;

  auto async_wait() -> awaitable<void>;

  // returns false when `timeout` elapsed before the event was set
  //
  auto async_wait_for(duration_type const timeout) -> awaitable<bool>;
};

} // detail
} // tether

#endif // TETHER_DETAIL_SIGNAL_HPP_
