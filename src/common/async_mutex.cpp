#include "common/async_mutex.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace livelink {

asio::awaitable<AsyncMutex::Guard> AsyncMutex::lock() {
    if (!locked_) {
        locked_ = true;
        co_return Guard(this);
    }

    auto waiter = std::make_shared<Waiter>(ex_);
    waiters_.push_back(waiter);

    // Only unlock() cancels this timer; ownership is handed over there
    boost::system::error_code ec;
    co_await waiter->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    co_return Guard(this);
}

std::optional<AsyncMutex::Guard> AsyncMutex::try_lock() {
    if (locked_) return std::nullopt;
    locked_ = true;
    return std::optional<Guard>(std::in_place, this);
}

void AsyncMutex::unlock() {
    if (waiters_.empty()) {
        locked_ = false;
        return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->timer.cancel();
}

} // namespace livelink
