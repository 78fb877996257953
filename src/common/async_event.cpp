#include "common/async_event.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace livelink {

AsyncEvent::AsyncEvent(asio::any_io_executor ex)
    : ex_(std::move(ex))
    , state_(std::make_shared<State>()) {}

AsyncEvent::~AsyncEvent() {
    state_->wake_all();
}

void AsyncEvent::set() {
    state_->set = true;
    state_->wake_all();
}

void AsyncEvent::reset() {
    state_->set = false;
}

void AsyncEvent::notify() {
    state_->wake_all();
}

asio::awaitable<bool> AsyncEvent::wait_for(duration timeout) {
    auto state = state_;
    if (state->set) co_return true;

    asio::steady_timer timer(ex_);
    if (timeout == duration::max()) {
        timer.expires_at(asio::steady_timer::time_point::max());
    } else {
        timer.expires_after(timeout);
    }

    Waiter waiter{&timer};
    auto it = state->waiters.insert(state->waiters.end(), &waiter);

    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    state->waiters.erase(it);
    co_return waiter.woken || state->set;
}

asio::awaitable<void> AsyncEvent::wait() {
    co_await wait_for(duration::max());
}

} // namespace livelink
