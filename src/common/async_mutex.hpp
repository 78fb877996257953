#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <deque>
#include <memory>
#include <optional>

namespace livelink {

namespace asio = boost::asio;

/// FIFO mutex for coroutines on a single executor.
///
/// lock() completes without suspending when the mutex is free. On unlock the
/// head waiter inherits ownership directly, so later lockers cannot overtake
/// it. Release happens in Guard's destructor on every exit path.
class AsyncMutex {
public:
    class Guard {
    public:
        Guard() = default;
        explicit Guard(AsyncMutex* mutex) : mutex_(mutex) {}
        ~Guard() { unlock(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        Guard(Guard&& other) noexcept : mutex_(other.mutex_) { other.mutex_ = nullptr; }
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                unlock();
                mutex_ = other.mutex_;
                other.mutex_ = nullptr;
            }
            return *this;
        }

        void unlock() {
            if (mutex_) {
                auto* m = mutex_;
                mutex_ = nullptr;
                m->unlock();
            }
        }

        bool owns_lock() const { return mutex_ != nullptr; }

    private:
        AsyncMutex* mutex_ = nullptr;
    };

    explicit AsyncMutex(asio::any_io_executor ex) : ex_(std::move(ex)) {}

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    asio::awaitable<Guard> lock();
    std::optional<Guard> try_lock();

    bool locked() const { return locked_; }
    size_t waiting() const { return waiters_.size(); }

private:
    struct Waiter {
        explicit Waiter(const asio::any_io_executor& ex)
            : timer(ex, asio::steady_timer::time_point::max()) {}
        asio::steady_timer timer;
    };

    void unlock();

    asio::any_io_executor ex_;
    bool locked_ = false;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

} // namespace livelink
