#include <gtest/gtest.h>
#include "common/async_event.hpp"
#include "common/async_mutex.hpp"
#include "common/cancel_signal.hpp"
#include "common/event_bus.hpp"
#include "fakes/test_utils.hpp"

#include <stdexcept>

using namespace livelink;
using namespace livelink::fakes;
using namespace std::chrono_literals;

// ============================================================================
// AsyncEvent
// ============================================================================

TEST(AsyncEvent, WaitForTimesOut) {
    asio::io_context ioc;
    AsyncEvent event(ioc.get_executor());
    auto start_time = std::chrono::steady_clock::now();
    EXPECT_FALSE(run_coro(ioc, event.wait_for(50ms)));
    EXPECT_GE(std::chrono::steady_clock::now() - start_time, 50ms);
    EXPECT_EQ(event.waiter_count(), 0u);
}

TEST(AsyncEvent, SetWakesAndLatches) {
    asio::io_context ioc;
    AsyncEvent event(ioc.get_executor());
    auto a = start(ioc, event.wait_for(5s));
    auto b = start(ioc, event.wait_for(5s));
    drain(ioc);
    EXPECT_EQ(event.waiter_count(), 2u);

    event.set();
    ASSERT_TRUE(run_until(ioc, [&] { return a->done && b->done; }));
    EXPECT_TRUE(*a->value);
    EXPECT_TRUE(*b->value);

    // Latched: later waits return immediately
    EXPECT_TRUE(run_coro(ioc, event.wait_for(1ms)));
    event.reset();
    EXPECT_FALSE(run_coro(ioc, event.wait_for(1ms)));
}

TEST(AsyncEvent, NotifyWakesWithoutLatching) {
    asio::io_context ioc;
    AsyncEvent event(ioc.get_executor());
    auto a = start(ioc, event.wait_for(5s));
    drain(ioc);

    event.notify();
    ASSERT_TRUE(run_until(ioc, [&] { return a->done; }));
    EXPECT_TRUE(*a->value);
    EXPECT_FALSE(event.is_set());
    EXPECT_FALSE(run_coro(ioc, event.wait_for(1ms)));
}

// ============================================================================
// AsyncMutex
// ============================================================================

namespace {

asio::awaitable<void> hold(AsyncMutex& mutex, std::vector<int>& order, int id,
                           std::chrono::milliseconds duration) {
    auto guard = co_await mutex.lock();
    order.push_back(id);
    co_await sleep_for(duration);
}

asio::awaitable<void> hold_then_throw(AsyncMutex& mutex) {
    auto guard = co_await mutex.lock();
    throw std::runtime_error("boom");
}

}  // namespace

TEST(AsyncMutex, GrantsInFifoOrder) {
    asio::io_context ioc;
    AsyncMutex mutex(ioc.get_executor());
    std::vector<int> order;

    auto a = start(ioc, hold(mutex, order, 1, 20ms));
    auto b = start(ioc, hold(mutex, order, 2, 1ms));
    auto c = start(ioc, hold(mutex, order, 3, 1ms));
    drain(ioc);
    EXPECT_TRUE(mutex.locked());
    EXPECT_EQ(mutex.waiting(), 2u);

    ASSERT_TRUE(run_until(ioc, [&] { return a->done && b->done && c->done; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(mutex.locked());
}

TEST(AsyncMutex, ReleasedWhenHolderThrows) {
    asio::io_context ioc;
    AsyncMutex mutex(ioc.get_executor());

    auto failing = start(ioc, hold_then_throw(mutex));
    ASSERT_TRUE(run_until(ioc, [&] { return failing->done; }));
    EXPECT_TRUE(failing->error);
    EXPECT_FALSE(mutex.locked());

    auto guard = mutex.try_lock();
    ASSERT_TRUE(guard.has_value());
    EXPECT_FALSE(mutex.try_lock().has_value());
    guard->unlock();
    EXPECT_FALSE(mutex.locked());
}

// ============================================================================
// CancelSignal
// ============================================================================

TEST(CancelSignal, ListenersRunOnceInOrder) {
    auto signal = CancelSignal::create();
    std::vector<int> calls;
    auto h1 = signal->on_cancel([&] { calls.push_back(1); });
    auto h2 = signal->on_cancel([&] { calls.push_back(2); });

    EXPECT_FALSE(is_cancelled(signal));
    signal->cancel();
    signal->cancel();
    EXPECT_TRUE(is_cancelled(signal));
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(CancelSignal, LateListenerRunsImmediately) {
    auto signal = CancelSignal::create();
    signal->cancel();
    bool called = false;
    auto h = signal->on_cancel([&] { called = true; });
    EXPECT_TRUE(called);
}

TEST(CancelSignal, ReleasedHandleDoesNotFire) {
    auto signal = CancelSignal::create();
    bool called = false;
    {
        auto h = signal->on_cancel([&] { called = true; });
    }
    signal->cancel();
    EXPECT_FALSE(called);
    EXPECT_FALSE(is_cancelled(nullptr));
}

// ============================================================================
// EventBus
// ============================================================================

namespace {

struct Ping : TypedEvent<Ping> {
    int value = 0;
};

struct Other : TypedEvent<Other> {};

}  // namespace

TEST(EventBus, DispatchesByType) {
    EventBus bus;
    std::vector<int> seen;
    int others = 0;
    auto s1 = bus.subscribe<Ping>([&](const Ping& p) { seen.push_back(p.value); });
    auto s2 = bus.subscribe<Other>([&](const Other&) { ++others; });

    Ping p;
    p.value = 7;
    bus.publish(p);
    bus.publish(Other{});
    EXPECT_EQ(seen, (std::vector<int>{7}));
    EXPECT_EQ(others, 1);
    EXPECT_EQ(bus.subscriber_count<Ping>(), 1u);
}

TEST(EventBus, HandleUnsubscribesAndMayOutliveBus) {
    SubscriptionHandle outliving;
    {
        EventBus bus;
        int calls = 0;
        {
            auto handle = bus.subscribe<Ping>([&](const Ping&) { ++calls; });
            bus.publish(Ping{});
        }
        bus.publish(Ping{});
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(bus.subscriber_count<Ping>(), 0u);

        outliving = bus.subscribe<Ping>([](const Ping&) {});
    }
    outliving.unsubscribe();
    EXPECT_FALSE(outliving);
}

TEST(EventBus, HandlerExceptionDoesNotStopDelivery) {
    EventBus bus;
    int calls = 0;
    auto s1 = bus.subscribe<Ping>([](const Ping&) { throw std::runtime_error("handler failed"); });
    auto s2 = bus.subscribe<Ping>([&](const Ping&) { ++calls; });
    bus.publish(Ping{});
    EXPECT_EQ(calls, 1);
}
