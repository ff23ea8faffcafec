#include "bus/event_bus.hpp"

#include <vector>

namespace clubhouse::bus {

void EventBus::Publish(const AgentEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push(event);
    }
    cv_.notify_one();
}

AgentEvent EventBus::Consume() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });
    auto event = events_.front();
    events_.pop();
    return event;
}

bool EventBus::TryConsume(AgentEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return false;
    }
    event = events_.front();
    events_.pop();
    return true;
}

std::size_t EventBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

EventBus::SubscriptionId EventBus::Subscribe(const std::string& agent_id, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    subscribers_.emplace(id, Subscription{agent_id, std::move(callback)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

void EventBus::Deliver(const AgentEvent& event) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, subscription] : subscribers_) {
            if (subscription.agent_id.empty() || subscription.agent_id == event.agent_id) {
                callbacks.push_back(subscription.callback);
            }
        }
    }
    for (const auto& cb : callbacks) {
        if (cb) {
            cb(event);
        }
    }
}

void EventBus::DispatchEvents() {
    while (!stopped_) {
        AgentEvent event{};
        if (!TryConsume(event, std::chrono::milliseconds(200))) {
            continue;
        }
        Deliver(event);
    }
}

std::size_t EventBus::DispatchPending() {
    std::size_t delivered = 0;
    AgentEvent event{};
    while (TryConsume(event, std::chrono::milliseconds(0))) {
        Deliver(event);
        ++delivered;
    }
    return delivered;
}

void EventBus::Stop() {
    stopped_ = true;
    cv_.notify_all();
}

EventDispatcher::EventDispatcher(EventBus& bus)
    : bus_(bus)
    , thread_([this] { bus_.DispatchEvents(); }) {}

EventDispatcher::~EventDispatcher() {
    bus_.Stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace clubhouse::bus
