#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace livelink {

// ============================================================================
// Reconnect Context
// ============================================================================

struct ReconnectContext {
    // Failed reconnect attempts so far in this burst
    uint32_t retry_count{0};

    // Time since the first disconnect of this burst
    std::chrono::milliseconds elapsed{0};

    // Description of the failure that triggered this retry, if any
    std::optional<std::string> retry_reason;

    std::optional<std::string> server_url;
};

// ============================================================================
// Reconnect Policy
// ============================================================================

class ReconnectPolicy {
public:
    virtual ~ReconnectPolicy() = default;

    /// Delay before the next attempt, or nullopt to stop retrying.
    /// An exception thrown here is treated as nullopt by the engine.
    virtual std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext& context) = 0;
};

// Fixed delay table with random jitter from the third attempt on
class DefaultReconnectPolicy : public ReconnectPolicy {
public:
    static constexpr std::chrono::milliseconds kMaxRetryDelay{7000};
    static constexpr std::chrono::milliseconds kMaxJitter{1000};

    static std::vector<std::chrono::milliseconds> default_delays();

    explicit DefaultReconnectPolicy(std::vector<std::chrono::milliseconds> delays = default_delays(),
                                    std::chrono::milliseconds max_jitter = kMaxJitter);

    std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext& context) override;

    const std::vector<std::chrono::milliseconds>& delays() const { return delays_; }

private:
    std::vector<std::chrono::milliseconds> delays_;
    std::chrono::milliseconds max_jitter_;
};

// Returns the configured delays verbatim, then stops
class FixedReconnectPolicy : public ReconnectPolicy {
public:
    explicit FixedReconnectPolicy(std::vector<std::chrono::milliseconds> delays)
        : delays_(std::move(delays)) {}

    std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext& context) override {
        if (context.retry_count >= delays_.size()) return std::nullopt;
        return delays_[context.retry_count];
    }

private:
    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace livelink
