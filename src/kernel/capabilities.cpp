#include "kernel/capabilities.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "util/sanitize.hpp"

namespace bastion::kernel {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

const std::set<std::string>& memory_patterns(const AgentManifest& manifest, MemoryAccess op) {
    return op == MemoryAccess::READ ? manifest.capabilities.memory_read
                                    : manifest.capabilities.memory_write;
}

} // namespace

const char* memory_access_to_string(MemoryAccess op) {
    return op == MemoryAccess::READ ? "read" : "write";
}

bool CapabilityPolicy::blocks(const std::string& tool) const {
    return contains(blocked_tools, tool);
}

nlohmann::json CapabilityPolicy::to_json() const {
    nlohmann::json j;
    j["allowed_tools"] = allowed_tools;
    j["blocked_tools"] = blocked_tools;
    j["max_tokens_per_hour"] = max_tokens_per_hour;
    j["max_concurrent_tools"] = max_concurrent_tools;
    return j;
}

// ============================================================================
// Glob matching
// ============================================================================

bool CapabilityGuard::glob_matches(const std::string& pattern, const std::string& text) noexcept {
    size_t p = 0, t = 0;
    size_t star = std::string::npos;
    size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string::npos) {
            // Let the last '*' absorb one more character and retry
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool CapabilityGuard::glob_covers(const std::string& outer, const std::string& inner) noexcept {
    // Outer literals can only line up with inner literals, so matching the
    // inner pattern text as a key is enough: each inner '*' lands in an outer '*'.
    return glob_matches(outer, inner);
}

// ============================================================================
// Predicates
// ============================================================================

bool CapabilityGuard::permits_tool(const AgentManifest& manifest, const std::string& tool) noexcept {
    const auto& tools = manifest.capabilities.tools;
    return tools.count("*") > 0 || tools.count(tool) > 0;
}

bool CapabilityGuard::permits_memory(const AgentManifest& manifest, MemoryAccess op,
                                     const std::string& key) noexcept {
    for (const auto& pattern : memory_patterns(manifest, op)) {
        if (glob_matches(pattern, key)) return true;
    }
    return false;
}

bool CapabilityGuard::permits_skill(const AgentManifest& manifest, const std::string& skill) noexcept {
    // Empty allowlist = every installed skill
    return manifest.skills.empty() || contains(manifest.skills, skill);
}

bool CapabilityGuard::permits_mcp_server(const AgentManifest& manifest, const std::string& server) noexcept {
    return manifest.mcp_servers.empty() || contains(manifest.mcp_servers, server);
}

// ============================================================================
// Checks
// ============================================================================

void CapabilityGuard::check_tool(const AgentManifest& manifest, const std::string& tool, AgentId agent) {
    if (permits_tool(manifest, tool)) {
        if (spdlog::should_log(spdlog::level::debug)) {
            spdlog::debug("Tool permitted: agent={} tool={}", agent, util::sanitize_name(tool));
        }
        return;
    }
    throw CapabilityDenied(CapabilityKind::TOOL, util::sanitize_name(tool), agent);
}

void CapabilityGuard::check_memory(const AgentManifest& manifest, MemoryAccess op,
                                   const std::string& key, AgentId agent) {
    if (permits_memory(manifest, op, key)) {
        return;
    }
    throw CapabilityDenied(op == MemoryAccess::READ ? CapabilityKind::MEMORY_READ
                                                    : CapabilityKind::MEMORY_WRITE,
                           util::sanitize_name(key), agent);
}

void CapabilityGuard::check_skill(const AgentManifest& manifest, const std::string& skill, AgentId agent) {
    if (!permits_skill(manifest, skill)) {
        throw CapabilityDenied(CapabilityKind::SKILL, util::sanitize_name(skill), agent);
    }
}

void CapabilityGuard::check_mcp_server(const AgentManifest& manifest, const std::string& server,
                                       AgentId agent) {
    if (!permits_mcp_server(manifest, server)) {
        throw CapabilityDenied(CapabilityKind::MCP_SERVER, util::sanitize_name(server), agent);
    }
}

void CapabilityGuard::check_policy(const AgentManifest& manifest, const CapabilityPolicy& policy) {
    bool any_tool = contains(policy.allowed_tools, "*");

    for (const auto& tool : manifest.capabilities.tools) {
        // A wildcard grant needs a wildcard policy; blocked tools are then
        // refused per call by blocks()
        if (tool == "*") {
            if (!any_tool) throw CapabilityDenied(CapabilityKind::POLICY, "tool:*");
            continue;
        }
        if (policy.blocks(tool) || (!any_tool && !contains(policy.allowed_tools, tool))) {
            throw CapabilityDenied(CapabilityKind::POLICY, "tool:" + util::sanitize_name(tool));
        }
    }

    if (policy.max_tokens_per_hour > 0 &&
        manifest.resources.max_llm_tokens_per_hour > policy.max_tokens_per_hour) {
        throw CapabilityDenied(CapabilityKind::POLICY,
                               "max_llm_tokens_per_hour=" +
                               std::to_string(manifest.resources.max_llm_tokens_per_hour));
    }
    if (policy.max_concurrent_tools > 0 &&
        manifest.resources.max_concurrent_tools > policy.max_concurrent_tools) {
        throw CapabilityDenied(CapabilityKind::POLICY,
                               "max_concurrent_tools=" +
                               std::to_string(manifest.resources.max_concurrent_tools));
    }
}

void CapabilityGuard::check_inheritance(const AgentManifest& parent, const AgentManifest& child) {
    if (!parent.capabilities.allows_all_tools()) {
        for (const auto& tool : child.capabilities.tools) {
            if (!parent.capabilities.tools.count(tool)) {
                throw CapabilityDenied(CapabilityKind::POLICY,
                                       "tool:" + util::sanitize_name(tool));
            }
        }
    }

    for (auto op : {MemoryAccess::READ, MemoryAccess::WRITE}) {
        const auto& granted = memory_patterns(parent, op);
        for (const auto& pattern : memory_patterns(child, op)) {
            bool covered = std::any_of(granted.begin(), granted.end(), [&](const std::string& outer) {
                return glob_covers(outer, pattern);
            });
            if (!covered) {
                throw CapabilityDenied(CapabilityKind::POLICY,
                                       std::string("memory_") + memory_access_to_string(op) +
                                       ":" + util::sanitize_name(pattern));
            }
        }
    }
}

} // namespace bastion::kernel
