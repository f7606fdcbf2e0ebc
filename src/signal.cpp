#include "tether/detail/signal.hpp"

#include <boost/system/error_code.hpp>
#include <boost/core/ignore_unused.hpp>

#include <algorithm>

using boost::system::error_code;
using boost::ignore_unused;

tether::detail::async_event::async_event(executor_type executor)
: executor_(std::move(executor))
{
}

auto tether::detail::async_event::set() -> void {
  set_ = true;
  for (auto& waiter : waiters_) {
    waiter->cancel();
  }
}

auto tether::detail::async_event::reset() -> void {
  set_ = false;
}

auto tether::detail::async_event::is_set() const -> bool {
  return set_;
}

auto tether::detail::async_event::wait_until_set(
  std::shared_ptr<timer_type> waiter
) -> awaitable<void> {

  waiters_.push_back(waiter);

  // cancellation by `set` and expiry both end the wait, the caller inspects
  // `set_` to tell them apart
  //
  auto ec = error_code();
  co_await waiter->async_wait(redirect_error(use_awaitable, ec));
  ignore_unused(ec);

  waiters_.erase(
    std::remove(waiters_.begin(), waiters_.end(), waiter),
    waiters_.end());
}

auto tether::detail::async_event::async_wait() -> awaitable<void> {
  while (!set_) {
    auto waiter = std::make_shared<timer_type>(
      executor_, timer_type::time_point::max());

    co_await wait_until_set(waiter);
  }
}

auto tether::detail::async_event::async_wait_for(
  duration_type const timeout
) -> awaitable<bool> {

  if (set_) { co_return true; }

  auto waiter = std::make_shared<timer_type>(executor_, timeout);
  co_await wait_until_set(waiter);

  co_return set_;
}
