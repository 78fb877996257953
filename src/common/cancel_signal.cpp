#include "common/cancel_signal.hpp"

namespace livelink {

void CancelSignal::cancel() {
    if (state_->cancelled) return;
    state_->cancelled = true;

    // Listeners may unsubscribe others while running
    auto state = state_;
    while (!state->listeners.empty()) {
        auto node = state->listeners.extract(state->listeners.begin());
        node.mapped()();
    }
}

SubscriptionHandle CancelSignal::on_cancel(std::function<void()> fn) {
    if (state_->cancelled) {
        fn();
        return {};
    }

    auto id = state_->next_id++;
    state_->listeners.emplace(id, std::move(fn));

    std::weak_ptr<State> weak = state_;
    return SubscriptionHandle([weak, id] {
        if (auto state = weak.lock()) {
            state->listeners.erase(id);
        }
    });
}

} // namespace livelink
