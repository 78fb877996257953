#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace livelink {

// ============================================================================
// Event Base Class
// ============================================================================

struct Event {
    virtual ~Event() = default;
    virtual std::type_index type() const = 0;
};

template<typename T>
struct TypedEvent : Event {
    std::type_index type() const override { return std::type_index(typeid(T)); }
};

// ============================================================================
// Subscription Handle
// ============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}
    ~SubscriptionHandle() { unsubscribe(); }

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    SubscriptionHandle(SubscriptionHandle&& other) noexcept : unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    void unsubscribe() {
        if (unsubscribe_) {
            auto fn = std::move(unsubscribe_);
            unsubscribe_ = nullptr;
            fn();
        }
    }

    // Drop the handle without unsubscribing
    void release() { unsubscribe_ = nullptr; }

    explicit operator bool() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

using SubscriptionList = std::vector<SubscriptionHandle>;

// ============================================================================
// Event Bus
// ============================================================================

// Synchronous typed publish/subscribe. Handles may outlive the bus.
class EventBus {
public:
    using HandlerId = uint64_t;

    EventBus() : registry_(std::make_shared<Registry>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    [[nodiscard]] SubscriptionHandle subscribe(std::function<void(const EventType&)> handler) {
        auto type = std::type_index(typeid(EventType));
        HandlerId id;

        auto wrapper = [handler = std::move(handler)](const Event& e) {
            handler(static_cast<const EventType&>(e));
        };

        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            id = registry_->next_id++;
            registry_->handlers[type].emplace_back(id, std::move(wrapper));
        }

        std::weak_ptr<Registry> weak = registry_;
        return SubscriptionHandle([weak, type, id] {
            auto registry = weak.lock();
            if (!registry) return;
            std::lock_guard<std::mutex> lock(registry->mutex);
            auto it = registry->handlers.find(type);
            if (it == registry->handlers.end()) return;
            auto& list = it->second;
            for (auto h = list.begin(); h != list.end(); ++h) {
                if (h->first == id) {
                    list.erase(h);
                    break;
                }
            }
        });
    }

    // Calls handlers in subscription order before returning
    template<typename EventType>
    void publish(const EventType& event) {
        auto type = std::type_index(typeid(EventType));

        std::vector<std::function<void(const Event&)>> handlers_copy;
        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            auto it = registry_->handlers.find(type);
            if (it != registry_->handlers.end()) {
                handlers_copy.reserve(it->second.size());
                for (const auto& [_, handler] : it->second) {
                    handlers_copy.push_back(handler);
                }
            }
        }

        for (const auto& handler : handlers_copy) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                report_handler_error(e);
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto it = registry_->handlers.find(std::type_index(typeid(EventType)));
        return it == registry_->handlers.end() ? 0 : it->second.size();
    }

    // Remove every handler of every type
    void clear() {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        registry_->handlers.clear();
    }

private:
    struct Registry {
        std::mutex mutex;
        HandlerId next_id{0};
        std::unordered_map<std::type_index,
                           std::vector<std::pair<HandlerId, std::function<void(const Event&)>>>> handlers;
    };

    static void report_handler_error(const std::exception& e);

    std::shared_ptr<Registry> registry_;
};

} // namespace livelink
