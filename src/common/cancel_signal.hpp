#pragma once

#include "common/event_bus.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace livelink {

/// Cancellation token shared between the party that aborts an operation and
/// the bounded waits inside it. Listeners run once, in registration order.
class CancelSignal : public std::enable_shared_from_this<CancelSignal> {
public:
    static std::shared_ptr<CancelSignal> create() {
        return std::shared_ptr<CancelSignal>(new CancelSignal());
    }

    CancelSignal(const CancelSignal&) = delete;
    CancelSignal& operator=(const CancelSignal&) = delete;

    void cancel();
    bool cancelled() const { return state_->cancelled; }

    /// Register a listener. Runs immediately when already cancelled.
    [[nodiscard]] SubscriptionHandle on_cancel(std::function<void()> fn);

private:
    CancelSignal() : state_(std::make_shared<State>()) {}

    struct State {
        bool cancelled = false;
        uint64_t next_id = 0;
        std::map<uint64_t, std::function<void()>> listeners;
    };

    std::shared_ptr<State> state_;
};

using CancelSignalPtr = std::shared_ptr<CancelSignal>;

inline bool is_cancelled(const CancelSignalPtr& signal) {
    return signal && signal->cancelled();
}

} // namespace livelink
