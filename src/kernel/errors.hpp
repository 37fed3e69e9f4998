/**
 * Bastion Kernel Errors
 *
 * Every failure the control plane reports is a KernelError. Messages are
 * user-visible: they name the capability, limit or id involved and never
 * carry tool payloads or credentials.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "kernel/types.hpp"

namespace bastion::kernel {

class KernelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Manifest rejection (no state was mutated; safe to retry with fixed input)
// ----------------------------------------------------------------------------

enum class ManifestErrorKind {
    PARSE,
    VALIDATION,
    SIGNATURE_INVALID
};

inline const char* manifest_error_kind_to_string(ManifestErrorKind kind) {
    switch (kind) {
        case ManifestErrorKind::PARSE:             return "ParseError";
        case ManifestErrorKind::VALIDATION:        return "ValidationError";
        case ManifestErrorKind::SIGNATURE_INVALID: return "SignatureInvalid";
        default: return "Unknown";
    }
}

class ManifestError : public KernelError {
public:
    ManifestError(ManifestErrorKind kind, const std::string& message)
        : KernelError(std::string(manifest_error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ManifestErrorKind kind() const { return kind_; }

private:
    ManifestErrorKind kind_;
};

// ----------------------------------------------------------------------------
// Capability denial (expected, always audited)
// ----------------------------------------------------------------------------

enum class CapabilityKind {
    TOOL,
    MEMORY_READ,
    MEMORY_WRITE,
    SKILL,
    MCP_SERVER,
    POLICY
};

inline const char* capability_kind_to_string(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::TOOL:         return "tool";
        case CapabilityKind::MEMORY_READ:  return "memory_read";
        case CapabilityKind::MEMORY_WRITE: return "memory_write";
        case CapabilityKind::SKILL:        return "skill";
        case CapabilityKind::MCP_SERVER:   return "mcp_server";
        case CapabilityKind::POLICY:       return "policy";
        default: return "unknown";
    }
}

class CapabilityDenied : public KernelError {
public:
    CapabilityDenied(CapabilityKind kind, const std::string& capability,
                     AgentId agent = KERNEL_AGENT_ID)
        : KernelError(std::string("capability denied: ") + capability_kind_to_string(kind) +
                      " '" + capability + "' is not permitted")
        , kind_(kind)
        , capability_(capability)
        , agent_(agent) {}

    CapabilityKind kind() const { return kind_; }
    const std::string& capability() const { return capability_; }
    AgentId agent() const { return agent_; }

private:
    CapabilityKind kind_;
    std::string capability_;
    AgentId agent_;
};

// ----------------------------------------------------------------------------
// Quota rejection (expected, retryable once the window or a slot frees)
// ----------------------------------------------------------------------------

enum class QuotaKind {
    TOKENS,
    TOOL_SLOTS
};

class QuotaExceeded : public KernelError {
public:
    QuotaExceeded(AgentId agent, QuotaKind kind, uint64_t limit, uint64_t in_use, uint64_t requested)
        : KernelError(kind == QuotaKind::TOKENS
              ? "quota exceeded: agent " + std::to_string(agent) + " requested " +
                std::to_string(requested) + " tokens with " + std::to_string(in_use) + "/" +
                std::to_string(limit) + " used this hour"
              : "quota exceeded: agent " + std::to_string(agent) + " has " +
                std::to_string(in_use) + "/" + std::to_string(limit) + " tools in flight")
        , agent_(agent)
        , kind_(kind)
        , limit_(limit)
        , in_use_(in_use)
        , requested_(requested) {}

    AgentId agent() const { return agent_; }
    QuotaKind kind() const { return kind_; }
    uint64_t limit() const { return limit_; }
    uint64_t in_use() const { return in_use_; }
    uint64_t requested() const { return requested_; }

private:
    AgentId agent_;
    QuotaKind kind_;
    uint64_t limit_;
    uint64_t in_use_;
    uint64_t requested_;
};

// ----------------------------------------------------------------------------
// Registry and caller errors (no partial state left behind)
// ----------------------------------------------------------------------------

enum class SpawnErrorKind {
    INVALID_MANIFEST,
    PARENT_NOT_FOUND,
    NAME_CONFLICT,
    POLICY_VIOLATION
};

inline const char* spawn_error_kind_to_string(SpawnErrorKind kind) {
    switch (kind) {
        case SpawnErrorKind::INVALID_MANIFEST: return "InvalidManifest";
        case SpawnErrorKind::PARENT_NOT_FOUND: return "ParentNotFound";
        case SpawnErrorKind::NAME_CONFLICT:    return "NameConflict";
        case SpawnErrorKind::POLICY_VIOLATION: return "PolicyViolation";
        default: return "Unknown";
    }
}

class SpawnError : public KernelError {
public:
    SpawnError(SpawnErrorKind kind, const std::string& message,
               std::optional<ManifestErrorKind> manifest_error = std::nullopt)
        : KernelError(std::string(spawn_error_kind_to_string(kind)) + ": " + message)
        , kind_(kind)
        , manifest_error_(manifest_error) {}

    SpawnErrorKind kind() const { return kind_; }

    // Set when the spawn was rejected by the manifest verifier
    std::optional<ManifestErrorKind> manifest_error() const { return manifest_error_; }

private:
    SpawnErrorKind kind_;
    std::optional<ManifestErrorKind> manifest_error_;
};

class NotFound : public KernelError {
public:
    explicit NotFound(const std::string& what)
        : KernelError("not found: " + what) {}
};

class InvalidTransition : public KernelError {
public:
    InvalidTransition(AgentId agent, AgentState from, AgentState to)
        : KernelError("invalid transition for agent " + std::to_string(agent) + ": " +
                      agent_state_to_string(from) + " -> " + agent_state_to_string(to))
        , from_(from)
        , to_(to) {}

    AgentState from() const { return from_; }
    AgentState to() const { return to_; }

private:
    AgentState from_;
    AgentState to_;
};

class AgentNotRunning : public KernelError {
public:
    AgentNotRunning(AgentId agent, AgentState state)
        : KernelError("agent " + std::to_string(agent) + " is " + agent_state_to_string(state) +
                      ", not Running")
        , state_(state) {}

    AgentState state() const { return state_; }

private:
    AgentState state_;
};

class InvalidPattern : public KernelError {
public:
    explicit InvalidPattern(const std::string& message)
        : KernelError("invalid trigger pattern: " + message) {}
};

// ----------------------------------------------------------------------------
// Ledger failures (fatal; surfaced to operators, never auto-repaired)
// ----------------------------------------------------------------------------

class ChainBroken : public KernelError {
public:
    explicit ChainBroken(uint64_t at_sequence)
        : KernelError("audit chain broken at sequence " + std::to_string(at_sequence))
        , at_sequence_(at_sequence) {}

    uint64_t at_sequence() const { return at_sequence_; }

private:
    uint64_t at_sequence_;
};

class LedgerWriteError : public KernelError {
public:
    explicit LedgerWriteError(const std::string& message)
        : KernelError("audit ledger write failed: " + message) {}
};

class KernelHalted : public KernelError {
public:
    explicit KernelHalted(const std::string& message)
        : KernelError("kernel halted: " + message) {}
};

} // namespace bastion::kernel
