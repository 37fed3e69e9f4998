#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "kernel/manifest.hpp"

namespace bastion::kernel {

enum class MemoryAccess {
    READ,
    WRITE
};

// System-wide limits applied to every manifest at spawn time
struct CapabilityPolicy {
    std::vector<std::string> allowed_tools{"*"};  // "*" = any tool may be declared
    std::vector<std::string> blocked_tools;       // Never grantable, even through "*"
    uint64_t max_tokens_per_hour = 0;             // Ceiling for manifests, 0 = none
    uint32_t max_concurrent_tools = 0;            // Ceiling for manifests, 0 = none

    bool blocks(const std::string& tool) const;
    nlohmann::json to_json() const;
};

// Stateless capability checks. Everything here is a pure function of the
// manifest and the request; nothing locks or allocates on the permit path.
class CapabilityGuard {
public:
    // Predicates
    static bool permits_tool(const AgentManifest& manifest, const std::string& tool) noexcept;
    static bool permits_memory(const AgentManifest& manifest, MemoryAccess op,
                               const std::string& key) noexcept;
    static bool permits_skill(const AgentManifest& manifest, const std::string& skill) noexcept;
    static bool permits_mcp_server(const AgentManifest& manifest, const std::string& server) noexcept;

    // Throwing forms; CapabilityDenied names the attempted capability
    static void check_tool(const AgentManifest& manifest, const std::string& tool,
                           AgentId agent = KERNEL_AGENT_ID);
    static void check_memory(const AgentManifest& manifest, MemoryAccess op,
                             const std::string& key, AgentId agent = KERNEL_AGENT_ID);
    static void check_skill(const AgentManifest& manifest, const std::string& skill,
                            AgentId agent = KERNEL_AGENT_ID);
    static void check_mcp_server(const AgentManifest& manifest, const std::string& server,
                                 AgentId agent = KERNEL_AGENT_ID);

    // Declared capabilities and resources against system policy
    static void check_policy(const AgentManifest& manifest, const CapabilityPolicy& policy);

    // A child never holds more than its parent
    static void check_inheritance(const AgentManifest& parent, const AgentManifest& child);

    // '*' matches any run of characters (including none); everything else is literal
    static bool glob_matches(const std::string& pattern, const std::string& text) noexcept;

    // True if every key matched by inner is also matched by outer
    static bool glob_covers(const std::string& outer, const std::string& inner) noexcept;
};

const char* memory_access_to_string(MemoryAccess op);

} // namespace bastion::kernel
