#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>

#include "bus/events.hpp"

namespace clubhouse::bus {

// Queue of agent events. Either drain it with Consume/TryConsume or run
// DispatchEvents on one thread to deliver to subscribers, not both.
class EventBus {
public:
    using Callback = std::function<void(const AgentEvent&)>;
    using SubscriptionId = std::uint64_t;

    void Publish(const AgentEvent& event);
    AgentEvent Consume();
    bool TryConsume(AgentEvent& event, std::chrono::milliseconds timeout);
    std::size_t Size() const;

    // An empty agent_id subscribes to every agent.
    SubscriptionId Subscribe(const std::string& agent_id, Callback callback);
    bool Unsubscribe(SubscriptionId id);

    // Runs until Stop(). Stop is final for this bus.
    void DispatchEvents();
    // Delivers everything currently queued and returns the count.
    std::size_t DispatchPending();
    void Stop();

private:
    struct Subscription {
        std::string agent_id;
        Callback callback;
    };

    void Deliver(const AgentEvent& event);

    std::queue<AgentEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<SubscriptionId, Subscription> subscribers_;
    SubscriptionId next_id_ = 1;
    std::atomic<bool> stopped_{false};
};

// Runs bus.DispatchEvents() on its own thread. Destruction stops the bus
// and joins the thread.
class EventDispatcher {
public:
    explicit EventDispatcher(EventBus& bus);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    EventBus& bus_;
    std::thread thread_;
};

}  // namespace clubhouse::bus
