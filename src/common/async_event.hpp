#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <list>
#include <memory>

namespace livelink {

namespace asio = boost::asio;

/// Manual-reset event for coroutines running on one executor.
///
/// Every waiter parks on its own steady_timer; set() and notify() cancel
/// those timers, which is the timer-as-condition-variable pattern.
/// Not thread-safe: touch it from the owning executor only.
class AsyncEvent {
public:
    using duration = std::chrono::steady_clock::duration;

    explicit AsyncEvent(asio::any_io_executor ex);
    ~AsyncEvent();

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    // Latch and wake all waiters
    void set();
    void reset();
    bool is_set() const { return state_->set; }

    // Wake current waiters without latching
    void notify();

    /// Wait until set()/notify() or until timeout.
    /// @return true when woken or already set, false on timeout
    asio::awaitable<bool> wait_for(duration timeout);

    asio::awaitable<void> wait();

    size_t waiter_count() const { return state_->waiters.size(); }

private:
    struct Waiter {
        asio::steady_timer* timer;
        bool woken = false;
    };

    struct State {
        bool set = false;
        std::list<Waiter*> waiters;

        void wake_all() {
            for (auto* w : waiters) {
                w->woken = true;
                w->timer->cancel();
            }
        }
    };

    asio::any_io_executor ex_;
    std::shared_ptr<State> state_;
};

} // namespace livelink
