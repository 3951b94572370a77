#ifndef MESHGATE_GATEWAY_EVENTS_HPP
#define MESHGATE_GATEWAY_EVENTS_HPP

#include "meshgate/health/endpoint_health.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Gateway Events
// ─────────────────────────────────────────────────────────────────────────────
// Fixed set of notifications published by a Gateway. Subscribers are invoked
// synchronously on the thread that caused the transition, never with an
// internal lock held.

namespace events {

struct CircuitOpened {
    std::string service;
};

struct CircuitClosed {
    std::string service;
};

struct CircuitHalfOpened {
    std::string service;
};

struct EndpointMarked {
    std::string service;
    std::string endpoint;
    bool healthy;
    EndpointState state;
};

struct ServiceActivityChanged {
    std::string service;
    bool active;
};

struct ServiceRegistered {
    std::string service;
};

struct ServiceUnregistered {
    std::string service;
};

}  // namespace events

using GatewayEvent = std::variant<
    events::CircuitOpened,
    events::CircuitClosed,
    events::CircuitHalfOpened,
    events::EndpointMarked,
    events::ServiceActivityChanged,
    events::ServiceRegistered,
    events::ServiceUnregistered
>;

using EventCallback = std::function<void(const GatewayEvent&)>;

// ─────────────────────────────────────────────────────────────────────────────
// EventBus
// ─────────────────────────────────────────────────────────────────────────────
// Observer registry. publish() snapshots the subscribers and invokes them
// without holding the lock, so a subscriber may (un)subscribe or query the
// gateway from inside its callback.

class EventBus {
public:
    using SubscriptionId = std::size_t;

    SubscriptionId subscribe(EventCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = next_id_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.erase(id) > 0;
    }

    void publish(const GatewayEvent& event) const {
        std::vector<EventCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks.reserve(subscribers_.size());
            for (const auto& [id, callback] : subscribers_) {
                callbacks.push_back(callback);
            }
        }
        for (const auto& callback : callbacks) {
            callback(event);
        }
    }

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, EventCallback> subscribers_;
    SubscriptionId next_id_{1};
};

}  // namespace meshgate

#endif  // MESHGATE_GATEWAY_EVENTS_HPP
