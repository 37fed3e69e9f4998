#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace bastion::kernel {

// Agent identifiers are handed out by the registry and never reused
using AgentId = uint64_t;

// Ledger entries written on behalf of the kernel itself
constexpr AgentId KERNEL_AGENT_ID = 0;

// Agent lifecycle state
enum class AgentState {
    SPAWNING,
    RUNNING,
    PAUSED,
    KILLED,
    ERRORED
};

const char* agent_state_to_string(AgentState state);

// Case-insensitive; accepts "Running", "RUNNING", "running"
std::optional<AgentState> agent_state_from_string(const std::string& str);

// Transition table:
//   Spawning -> Running | Errored | Killed
//   Running  -> Paused | Errored | Killed
//   Paused   -> Running | Killed
//   Errored  -> Running | Killed
//   Killed   -> (terminal)
bool is_valid_transition(AgentState from, AgentState to);

// ISO 8601 UTC with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace bastion::kernel
