#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "providers/provider_types.hpp"

namespace clubhouse::bus {

enum class AgentEventType {
    kHook,
    kExit
};

struct AgentEvent {
    AgentEventType type = AgentEventType::kHook;
    std::string agent_id;
    // Set for kHook.
    providers::NormalizedHookEvent hook;
    // Set for kExit. summary is only read back for quick agents.
    int exit_code = 0;
    std::optional<providers::QuickSummary> summary;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

inline AgentEvent MakeHookEvent(const std::string& agent_id, const providers::NormalizedHookEvent& hook) {
    AgentEvent event{};
    event.type = AgentEventType::kHook;
    event.agent_id = agent_id;
    event.hook = hook;
    return event;
}

inline AgentEvent MakeExitEvent(const std::string& agent_id, int exit_code) {
    AgentEvent event{};
    event.type = AgentEventType::kExit;
    event.agent_id = agent_id;
    event.exit_code = exit_code;
    return event;
}

}  // namespace clubhouse::bus
