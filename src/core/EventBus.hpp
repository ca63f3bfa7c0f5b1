#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event bus for decoupled communication between components.
 * Publish/subscribe over a single typed event, one bus per owner.
 */

#include <functional>
#include <vector>
#include <mutex>
#include <memory>
#include <atomic>
#include <algorithm>
#include <cstdint>

#include "Logger.hpp"

namespace modelfetch::core {

/**
 * Event subscription handle
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - Thread-safe publish/subscribe
 *
 * Features:
 * - Multiple subscribers, called in subscription order
 * - Subscription handles for unsubscribing
 * - Callbacks run outside the lock, so a subscriber may call back into
 *   the publisher without deadlocking
 */
template<typename Event>
class EventBus {
public:
    using Callback = std::function<void(const Event&)>;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to events
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto subscription = std::make_shared<Subscription>(m_nextId++);
        m_subscribers.push_back({subscription->getId(), std::move(callback), subscription});

        return subscription;
    }

    /**
     * Unsubscribe
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                [id = subscription->getId()](const SubscriberEntry& entry) {
                    return entry.id == id;
                }),
            m_subscribers.end()
        );
    }

    /**
     * Emit an event to every active subscriber
     * @param event Event data
     */
    void emit(const Event& event) {
        std::vector<Callback> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            callbacks.reserve(m_subscribers.size());
            for (const auto& entry : m_subscribers) {
                if (entry.subscription->isActive()) {
                    callbacks.push_back(entry.callback);
                }
            }
        }

        for (const auto& callback : callbacks) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                LOG_WARN("Event subscriber threw: {}", e.what());
            }
        }
    }

    /**
     * Get subscriber count
     * @return Number of subscribers
     */
    size_t getSubscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    /**
     * Clear all subscribers
     */
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_subscribers) {
            entry.subscription->cancel();
        }
        m_subscribers.clear();
    }

private:
    struct SubscriberEntry {
        uint64_t id;
        Callback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::vector<SubscriberEntry> m_subscribers;
    uint64_t m_nextId{0};
};

} // namespace modelfetch::core
