#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "agents/agent_registry.hpp"
#include "agents/provider_resolver.hpp"
#include "bus/event_bus.hpp"
#include "config/config_schema.hpp"
#include "providers/provider_types.hpp"

namespace boost::asio {
class io_context;
}  // namespace boost::asio

namespace clubhouse::hooks {

// A UI window receiving fan-out. Surfaces that report !IsAlive() are skipped.
class EventSurface {
public:
    virtual ~EventSurface() = default;

    virtual bool IsAlive() const = 0;
    virtual void OnHookEvent(const std::string& agent_id,
                             const providers::NormalizedHookEvent& event) = 0;
};

struct HookRoute {
    unsigned status = 404;
    std::string agent_id;
    std::string event_hint;
};

// POST /hook/{agentId}[/{eventHint}] -> 200, empty agentId -> 400,
// anything else -> 404.
HookRoute RouteHookRequest(const std::string& method, const std::string& target);

// Loopback HTTP listener for callbacks from spawned agents. Every routable
// request is answered before its body is authenticated and normalized, and
// that processing runs off the I/O threads.
class HookServer {
public:
    HookServer(config::HookServerConfig config,
               const agents::AgentRegistry& registry,
               const agents::ProviderResolver& resolver,
               bus::EventBus* bus = nullptr);
    ~HookServer();

    HookServer(const HookServer&) = delete;
    HookServer& operator=(const HookServer&) = delete;

    // Binds and starts the workers. Concurrent and repeated callers share one
    // future; a bind failure is delivered through it and a later Start retries.
    std::shared_future<std::uint16_t> Start();
    // Releases the socket and joins the workers. Events still queued for
    // processing are dropped. Must not be called from a surface or bus
    // callback.
    void Stop();

    bool IsRunning() const { return port_.load() != 0; }
    std::uint16_t Port() const { return port_.load(); }
    // Blocks until a pending Start resolves. Throws std::runtime_error when
    // the server was never started, or the bind error.
    std::uint16_t WaitReady();
    // http://127.0.0.1:<port>/hook
    std::string HookBaseUrl();

    void AddSurface(const std::shared_ptr<EventSurface>& surface);
    void RemoveSurface(const std::shared_ptr<EventSurface>& surface);

    // Authenticates, normalizes and fans out one delivered callback.
    void HandleHook(const std::string& agent_id,
                    const std::string& event_hint,
                    const std::optional<std::string>& nonce,
                    const std::string& body);

private:
    class Listener;
    class Session;
    struct Processing;

    void FanOut(const std::string& agent_id, const providers::NormalizedHookEvent& event);

    config::HookServerConfig config_;
    const agents::AgentRegistry& registry_;
    const agents::ProviderResolver& resolver_;
    bus::EventBus* bus_;

    std::mutex lifecycle_mutex_;
    std::shared_future<std::uint16_t> ready_;
    std::unique_ptr<Processing> processing_;
    std::unique_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<Listener> listener_;
    std::vector<std::thread> workers_;
    std::atomic<std::uint16_t> port_{0};

    std::mutex surfaces_mutex_;
    std::vector<std::weak_ptr<EventSurface>> surfaces_;
};

}  // namespace clubhouse::hooks
