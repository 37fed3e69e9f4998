#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "kernel/manifest.hpp"
#include "kernel/types.hpp"

namespace bastion::runtime {

using kernel::AgentId;
using kernel::AgentState;

// Snapshot of a registered agent. Parent and children are ids only;
// a child id may resolve to NotFound once that child is killed.
struct AgentEntry {
    AgentId id = kernel::KERNEL_AGENT_ID;
    std::string name;
    std::shared_ptr<const kernel::AgentManifest> manifest;
    AgentState state = AgentState::SPAWNING;
    std::optional<AgentId> parent;
    std::vector<AgentId> children;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_active;

    nlohmann::json to_json() const;
};

// Owns the live agent set. One mutex covers entries, names and the id
// counter, so readers always see whole entries.
class AgentRegistry {
public:
    AgentRegistry() = default;

    // Create an entry and bring it to Running. Throws SpawnError
    // (NameConflict, ParentNotFound).
    AgentId spawn(const kernel::AgentManifest& manifest, std::optional<AgentId> parent = std::nullopt);

    // Transition to Killed and drop from the live set. Children are
    // orphaned, not killed. Returns the final snapshot; throws NotFound.
    AgentEntry kill(AgentId id);

    // Lifecycle transitions; throw NotFound or InvalidTransition.
    // Each returns the state the agent left.
    AgentState pause(AgentId id);
    AgentState resume(AgentId id);
    AgentState mark_errored(AgentId id);
    AgentState recover(AgentId id);
    AgentState transition(AgentId id, AgentState to);

    // Record activity
    void touch(AgentId id);

    // Swap the manifest of a live agent; the name stays the same.
    // Returns the previous manifest.
    std::shared_ptr<const kernel::AgentManifest> update_manifest(AgentId id,
                                                                 const kernel::AgentManifest& manifest);

    std::optional<AgentEntry> get(AgentId id) const;
    std::optional<AgentEntry> find_by_name(const std::string& name) const;
    std::vector<AgentEntry> list() const;  // Ordered by id
    std::vector<AgentId> children(AgentId id) const;
    size_t count() const;

    bool is_live(AgentId id) const;
    bool was_killed(AgentId id) const;

private:
    mutable std::mutex mutex_;
    std::map<AgentId, AgentEntry> agents_;
    std::unordered_map<std::string, AgentId> ids_by_name_;
    std::set<AgentId> killed_;
    AgentId next_id_ = 1;

    AgentEntry& entry_locked(AgentId id);
    AgentEntry kill_locked(AgentId id);
    bool was_killed_locked(AgentId id) const;
};

} // namespace bastion::runtime
