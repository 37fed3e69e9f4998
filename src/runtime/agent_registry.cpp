#include "runtime/agent_registry.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace bastion::runtime {

using kernel::InvalidTransition;
using kernel::NotFound;
using kernel::SpawnError;
using kernel::SpawnErrorKind;

nlohmann::json AgentEntry::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["state"] = kernel::agent_state_to_string(state);
    j["parent"] = parent ? nlohmann::json(*parent) : nlohmann::json(nullptr);
    j["children"] = children;
    j["created_at"] = kernel::format_timestamp(created_at);
    j["last_active"] = kernel::format_timestamp(last_active);
    if (manifest) {
        j["manifest"] = kernel::manifest_to_json(*manifest);
    }
    return j;
}

AgentEntry& AgentRegistry::entry_locked(AgentId id) {
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw NotFound(was_killed_locked(id) ? "agent " + std::to_string(id) + " (killed)"
                                             : "agent " + std::to_string(id));
    }
    return it->second;
}

bool AgentRegistry::was_killed_locked(AgentId id) const {
    return killed_.count(id) > 0;
}

// ============================================================================
// Spawn / kill
// ============================================================================

AgentId AgentRegistry::spawn(const kernel::AgentManifest& manifest, std::optional<AgentId> parent) {
    auto shared = std::make_shared<const kernel::AgentManifest>(manifest);

    std::lock_guard<std::mutex> lock(mutex_);

    if (ids_by_name_.count(manifest.name)) {
        throw SpawnError(SpawnErrorKind::NAME_CONFLICT,
                         "an agent named '" + manifest.name + "' is already running");
    }
    if (parent && !agents_.count(*parent)) {
        throw SpawnError(SpawnErrorKind::PARENT_NOT_FOUND,
                         "parent agent " + std::to_string(*parent) + " is not live");
    }

    AgentEntry entry;
    entry.id = next_id_++;
    entry.name = manifest.name;
    entry.manifest = std::move(shared);
    entry.parent = parent;
    entry.created_at = std::chrono::system_clock::now();
    entry.last_active = entry.created_at;

    // Spawning is never observable: the entry is published already Running
    entry.state = AgentState::RUNNING;

    AgentId id = entry.id;
    if (parent) {
        agents_.at(*parent).children.push_back(id);
    }
    ids_by_name_[entry.name] = id;
    agents_.emplace(id, std::move(entry));

    spdlog::debug("Registry: spawned {} (id={}, parent={})", manifest.name, id,
                  parent ? std::to_string(*parent) : "none");
    return id;
}

AgentEntry AgentRegistry::kill(AgentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_locked(id);
}

AgentEntry AgentRegistry::kill_locked(AgentId id) {
    AgentEntry& entry = entry_locked(id);
    if (!kernel::is_valid_transition(entry.state, AgentState::KILLED)) {
        throw InvalidTransition(id, entry.state, AgentState::KILLED);
    }
    entry.state = AgentState::KILLED;
    entry.last_active = std::chrono::system_clock::now();

    // Detach from the parent
    if (entry.parent) {
        auto parent_it = agents_.find(*entry.parent);
        if (parent_it != agents_.end()) {
            auto& siblings = parent_it->second.children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
        }
    }

    // Orphan the children
    for (AgentId child : entry.children) {
        auto child_it = agents_.find(child);
        if (child_it != agents_.end()) {
            child_it->second.parent.reset();
        }
    }

    AgentEntry final_entry = std::move(entry);
    ids_by_name_.erase(final_entry.name);
    agents_.erase(id);
    killed_.insert(id);

    spdlog::debug("Registry: killed {} (id={}, orphaned {} children)",
                  final_entry.name, id, final_entry.children.size());
    return final_entry;
}

// ============================================================================
// Lifecycle
// ============================================================================

AgentState AgentRegistry::transition(AgentId id, AgentState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    AgentEntry& entry = entry_locked(id);
    AgentState from = entry.state;
    if (to == AgentState::KILLED) {
        kill_locked(id);
        return from;
    }
    if (!kernel::is_valid_transition(from, to)) {
        throw InvalidTransition(id, from, to);
    }
    entry.state = to;
    entry.last_active = std::chrono::system_clock::now();
    spdlog::debug("Registry: agent {} {} -> {}", id,
                  kernel::agent_state_to_string(from), kernel::agent_state_to_string(to));
    return from;
}

AgentState AgentRegistry::pause(AgentId id) {
    return transition(id, AgentState::PAUSED);
}

AgentState AgentRegistry::resume(AgentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    AgentEntry& entry = entry_locked(id);
    if (entry.state != AgentState::PAUSED) {
        throw InvalidTransition(id, entry.state, AgentState::RUNNING);
    }
    entry.state = AgentState::RUNNING;
    entry.last_active = std::chrono::system_clock::now();
    return AgentState::PAUSED;
}

AgentState AgentRegistry::mark_errored(AgentId id) {
    return transition(id, AgentState::ERRORED);
}

AgentState AgentRegistry::recover(AgentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    AgentEntry& entry = entry_locked(id);
    if (entry.state != AgentState::ERRORED) {
        throw InvalidTransition(id, entry.state, AgentState::RUNNING);
    }
    entry.state = AgentState::RUNNING;
    entry.last_active = std::chrono::system_clock::now();
    return AgentState::ERRORED;
}

void AgentRegistry::touch(AgentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(id).last_active = std::chrono::system_clock::now();
}

std::shared_ptr<const kernel::AgentManifest> AgentRegistry::update_manifest(
        AgentId id, const kernel::AgentManifest& manifest) {
    auto shared = std::make_shared<const kernel::AgentManifest>(manifest);

    std::lock_guard<std::mutex> lock(mutex_);
    AgentEntry& entry = entry_locked(id);
    auto previous = std::move(entry.manifest);
    entry.manifest = std::move(shared);
    entry.last_active = std::chrono::system_clock::now();
    return previous;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<AgentEntry> AgentRegistry::get(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

std::optional<AgentEntry> AgentRegistry::find_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ids_by_name_.find(name);
    if (it == ids_by_name_.end()) return std::nullopt;
    return agents_.at(it->second);
}

std::vector<AgentEntry> AgentRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentEntry> result;
    result.reserve(agents_.size());
    for (const auto& [_, entry] : agents_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<AgentId> AgentRegistry::children(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw NotFound("agent " + std::to_string(id));
    }
    return it->second.children;
}

size_t AgentRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

bool AgentRegistry::is_live(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(id) > 0;
}

bool AgentRegistry::was_killed(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return was_killed_locked(id);
}

} // namespace bastion::runtime
