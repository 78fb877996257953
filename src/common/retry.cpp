#include "common/retry.hpp"

#include <random>

namespace livelink {

std::vector<std::chrono::milliseconds> DefaultReconnectPolicy::default_delays() {
    using std::chrono::milliseconds;
    std::vector<milliseconds> delays = {
        milliseconds(0),
        milliseconds(300),
        milliseconds(2 * 2 * 300),
        milliseconds(3 * 3 * 300),
        milliseconds(4 * 4 * 300),
    };
    for (int i = 0; i < 5; ++i) {
        delays.push_back(kMaxRetryDelay);
    }
    return delays;
}

DefaultReconnectPolicy::DefaultReconnectPolicy(std::vector<std::chrono::milliseconds> delays,
                                               std::chrono::milliseconds max_jitter)
    : delays_(std::move(delays)), max_jitter_(max_jitter) {}

std::optional<std::chrono::milliseconds> DefaultReconnectPolicy::next_retry_delay(
    const ReconnectContext& context) {
    if (context.retry_count >= delays_.size()) return std::nullopt;

    auto delay = delays_[context.retry_count];
    if (context.retry_count <= 1 || max_jitter_.count() <= 0) return delay;

    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, max_jitter_.count());
    return delay + std::chrono::milliseconds(dist(rng));
}

} // namespace livelink
