#include "kernel/types.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bastion::kernel {

const char* agent_state_to_string(AgentState state) {
    switch (state) {
        case AgentState::SPAWNING: return "Spawning";
        case AgentState::RUNNING:  return "Running";
        case AgentState::PAUSED:   return "Paused";
        case AgentState::KILLED:   return "Killed";
        case AgentState::ERRORED:  return "Errored";
        default: return "Unknown";
    }
}

std::optional<AgentState> agent_state_from_string(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "spawning") return AgentState::SPAWNING;
    if (lower == "running")  return AgentState::RUNNING;
    if (lower == "paused")   return AgentState::PAUSED;
    if (lower == "killed")   return AgentState::KILLED;
    if (lower == "errored")  return AgentState::ERRORED;
    return std::nullopt;
}

bool is_valid_transition(AgentState from, AgentState to) {
    switch (from) {
        case AgentState::SPAWNING:
            return to == AgentState::RUNNING || to == AgentState::ERRORED ||
                   to == AgentState::KILLED;
        case AgentState::RUNNING:
            return to == AgentState::PAUSED || to == AgentState::ERRORED ||
                   to == AgentState::KILLED;
        case AgentState::PAUSED:
            return to == AgentState::RUNNING || to == AgentState::KILLED;
        case AgentState::ERRORED:
            return to == AgentState::RUNNING || to == AgentState::KILLED;
        case AgentState::KILLED:
            return false;
    }
    return false;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace bastion::kernel
