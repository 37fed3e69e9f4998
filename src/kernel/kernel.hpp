/**
 * Bastion Kernel
 *
 * Composes the control-plane components into one pipeline:
 * - ManifestVerifier (parse and authenticate manifests)
 * - CapabilityGuard (tool, memory and policy checks)
 * - ResourceQuotaMeter (token rate and tool concurrency)
 * - AgentRegistry (live agents and their lifecycle)
 * - AuditLedger (hash-chained record of every decision)
 * - TriggerScheduler (events in, authorized actions out)
 *
 * Each component guards its own state. Lifecycle operations (spawn, kill,
 * transitions, capability updates) also hold one kernel lock across the
 * registry mutation, the quota account change and the audit entry, so the
 * ledger records them in the order they took effect. Tool calls and trigger
 * dispatch do not take it. If an audit append fails the kernel halts and
 * refuses every further mutation until confirm_ledger_health() succeeds.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/audit_log.hpp"
#include "kernel/capabilities.hpp"
#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "kernel/manifest.hpp"
#include "kernel/quota.hpp"
#include "kernel/triggers.hpp"
#include "runtime/agent_registry.hpp"

namespace bastion::kernel {

// The unit every tool call is evaluated as. input is never logged or audited.
struct ToolInvocationContext {
    AgentId agent = KERNEL_AGENT_ID;
    std::string tool;
    std::string input;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

enum class ToolOutcome {
    SUCCESS,
    FAILURE,
    TIMEOUT,
    CANCELLED
};

const char* tool_outcome_to_string(ToolOutcome outcome);

// An authorized tool call. Holds a concurrency slot until the result is
// recorded or the permit is destroyed.
struct ToolPermit {
    AgentId agent = KERNEL_AGENT_ID;
    std::string tool;
    uint64_t invoke_sequence = 0;   // Ledger sequence of the ToolInvoke entry
    ToolSlot slot;
};

class Kernel {
public:
    using Config = KernelConfig;
    using ActionHandler = std::function<void(const FiredAction&)>;

    explicit Kernel(const Config& config = Config());
    Kernel(const Config& config,
           std::unique_ptr<AuditLedger> ledger,
           ResourceQuotaMeter::NowFn quota_clock = [] { return QuotaClock::now(); },
           TriggerScheduler::NowFn trigger_clock = [] { return std::chrono::system_clock::now(); });
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // ------------------------------------------------------------------------
    // Agents
    // ------------------------------------------------------------------------

    // Verify, check against policy (and the parent's grants), register,
    // open the quota account and audit. Throws SpawnError.
    AgentId spawn_agent(const std::string& manifest_toml,
                        const std::optional<SignedManifestEnvelope>& envelope = std::nullopt,
                        std::optional<AgentId> parent = std::nullopt);

    // Throws NotFound for unknown or already-killed ids
    void kill_agent(AgentId id);

    void pause_agent(AgentId id);
    void resume_agent(AgentId id);
    void mark_errored(AgentId id, const std::string& reason);
    void recover_agent(AgentId id);

    // Replace a live agent's manifest (same name). Audited as ConfigChange.
    void update_capabilities(AgentId id, const std::string& manifest_toml,
                             const std::optional<SignedManifestEnvelope>& envelope = std::nullopt);

    std::vector<runtime::AgentEntry> list_agents() const;
    std::optional<runtime::AgentEntry> get_agent(AgentId id) const;

    // ------------------------------------------------------------------------
    // Tool calls, tokens, memory
    // ------------------------------------------------------------------------

    // Capability check, then quota, then the ToolInvoke entry. Denials and
    // quota rejections are audited before the error is thrown.
    ToolPermit authorize_tool(const ToolInvocationContext& ctx);

    // Releases the permit's slot whatever happens, then audits the outcome
    void record_tool_result(ToolPermit& permit, ToolOutcome outcome, const std::string& summary = "");

    void consume_tokens(AgentId agent, uint64_t tokens);

    void check_memory(AgentId agent, MemoryAccess op, const std::string& key);

    QuotaUsage quota_usage(AgentId agent) const;

    // ------------------------------------------------------------------------
    // Triggers
    // ------------------------------------------------------------------------

    TriggerId register_trigger(const TriggerDefinition& def);
    void unregister_trigger(TriggerId id);
    std::vector<TriggerDefinition> list_triggers() const;

    // Match the event and admit each fired action: the owning agent must be
    // Running and the prompt must fit its token quota. Returns what was admitted.
    std::vector<FiredAction> dispatch_event(const TriggerEvent& event);

    // Evaluate schedules against the trigger clock
    std::vector<FiredAction> tick();

    // Receives every admitted action, including ones fired by internal events
    void set_action_handler(ActionHandler handler);

    // ------------------------------------------------------------------------
    // Ledger
    // ------------------------------------------------------------------------

    ChainVerification verify_ledger() const;

    // Re-verify the chain, let the ledger's sink recover from a failed write
    // and clear the halt. Throws ChainBroken if the chain is still broken and
    // LedgerWriteError if the sink cannot recover; the kernel stays halted.
    ChainVerification confirm_ledger_health();

    bool halted() const { return halted_; }
    std::string halt_reason() const;

    const AuditLedger& ledger() const { return *ledger_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    ManifestVerifier verifier_;
    std::unique_ptr<AuditLedger> ledger_;
    runtime::AgentRegistry registry_;
    ResourceQuotaMeter quotas_;
    std::unique_ptr<TriggerScheduler> triggers_;

    std::atomic<bool> halted_{false};
    mutable std::mutex halt_mutex_;
    std::string halt_reason_;

    std::mutex lifecycle_mutex_;

    std::mutex handler_mutex_;
    ActionHandler action_handler_;

    void ensure_accepting() const;
    void enter_halt(const std::string& reason);

    // Append or halt: a ledger failure here leaves the kernel halted
    AuditEntry audit_or_halt(AuditAction action, AgentId agent, const std::string& detail);

    AgentManifest verify_manifest(const std::string& manifest_toml,
                                  const std::optional<SignedManifestEnvelope>& envelope,
                                  AgentId subject);
    void enforce_policy(const AgentManifest& manifest, std::optional<AgentId> parent, AgentId subject);
    std::shared_ptr<const AgentManifest> running_manifest(AgentId agent);
    void apply_transition(AgentId id, AgentState to, const std::string& note,
                          AgentState (runtime::AgentRegistry::*change)(AgentId));

    std::vector<FiredAction> admit(std::vector<FiredAction> fired);
    std::vector<FiredAction> fire(const TriggerEvent& event);

    // Events the kernel raises itself; a ledger failure halts but does not
    // undo the operation that raised them
    void emit_internal(const TriggerEvent& event);
};

} // namespace bastion::kernel
