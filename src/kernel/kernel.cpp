#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include "util/sanitize.hpp"

namespace bastion::kernel {

const char* tool_outcome_to_string(ToolOutcome outcome) {
    switch (outcome) {
        case ToolOutcome::SUCCESS:   return "success";
        case ToolOutcome::FAILURE:   return "failure";
        case ToolOutcome::TIMEOUT:   return "timeout";
        case ToolOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

namespace {

std::unique_ptr<AuditLedger> open_ledger(const KernelConfig& config) {
    if (config.audit_log_path.empty()) {
        spdlog::debug("Audit ledger is in-memory");
        return std::make_unique<AuditLedger>();
    }
    spdlog::info("Audit ledger: {}", config.audit_log_path);
    return AuditLedger::open(config.audit_log_path);
}

// Rough prompt cost charged to an agent before a fired action runs
uint64_t estimate_prompt_tokens(const std::string& prompt) {
    return prompt.size() / 4 + 1;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Kernel::Kernel(const Config& config)
    : Kernel(config, open_ledger(config)) {}

Kernel::Kernel(const Config& config,
               std::unique_ptr<AuditLedger> ledger,
               ResourceQuotaMeter::NowFn quota_clock,
               TriggerScheduler::NowFn trigger_clock)
    : config_(config)
    , verifier_(config.verifier)
    , ledger_(ledger ? std::move(ledger) : std::make_unique<AuditLedger>())
    , quotas_(std::move(quota_clock))
    , triggers_(std::make_unique<TriggerScheduler>(*ledger_, std::move(trigger_clock)))
{
    auto verification = ledger_->verify_chain();
    if (!verification.intact) {
        enter_halt(fmt::format("audit chain broken at sequence {}", *verification.broken_at));
    } else {
        spdlog::info("Kernel ready ({} audit entries, tip {})",
                     ledger_->size(), ledger_->tip().substr(0, 12));
    }
}

Kernel::~Kernel() = default;

// ============================================================================
// Halt handling
// ============================================================================

void Kernel::ensure_accepting() const {
    if (halted_) {
        throw KernelHalted(halt_reason());
    }
}

void Kernel::enter_halt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(halt_mutex_);
        halt_reason_ = reason;
    }
    halted_ = true;
    spdlog::critical("Kernel halted: {}", reason);
}

std::string Kernel::halt_reason() const {
    std::lock_guard<std::mutex> lock(halt_mutex_);
    return halt_reason_;
}

AuditEntry Kernel::audit_or_halt(AuditAction action, AgentId agent, const std::string& detail) {
    try {
        return ledger_->append(action, agent, detail);
    } catch (const LedgerWriteError& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    } catch (const ChainBroken& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    }
}

ChainVerification Kernel::verify_ledger() const {
    return ledger_->verify_chain();
}

ChainVerification Kernel::confirm_ledger_health() {
    auto verification = ledger_->verify_chain();
    if (!verification.intact) {
        throw ChainBroken(*verification.broken_at);
    }
    // Throws LedgerWriteError while the sink is still unusable
    ledger_->recover_sink();
    {
        std::lock_guard<std::mutex> lock(halt_mutex_);
        halt_reason_.clear();
    }
    if (halted_.exchange(false)) {
        spdlog::warn("Kernel resumed after operator confirmed ledger health ({} entries)",
                     verification.entries_checked);
    }
    return verification;
}

// ============================================================================
// Agents
// ============================================================================

AgentManifest Kernel::verify_manifest(const std::string& manifest_toml,
                                      const std::optional<SignedManifestEnvelope>& envelope,
                                      AgentId subject) {
    try {
        return verifier_.verify(manifest_toml, envelope);
    } catch (const ManifestError& e) {
        spdlog::error("Manifest rejected: {}", e.what());
        audit_or_halt(AuditAction::MANIFEST_REJECTED, subject, e.what());
        throw SpawnError(SpawnErrorKind::INVALID_MANIFEST, e.what(), e.kind());
    }
}

void Kernel::enforce_policy(const AgentManifest& manifest, std::optional<AgentId> parent,
                            AgentId subject) {
    try {
        CapabilityGuard::check_policy(manifest, config_.policy);
        if (parent) {
            auto parent_entry = registry_.get(*parent);
            if (!parent_entry) {
                throw SpawnError(SpawnErrorKind::PARENT_NOT_FOUND,
                                 fmt::format("parent agent {} does not exist", *parent));
            }
            CapabilityGuard::check_inheritance(*parent_entry->manifest, manifest);
        }
    } catch (const CapabilityDenied& e) {
        spdlog::warn("Agent '{}' exceeds its grants: {}", manifest.name, e.what());
        audit_or_halt(AuditAction::CAPABILITY_DENIED, subject,
                      fmt::format("manifest '{}': {}", manifest.name, e.what()));
        throw SpawnError(SpawnErrorKind::POLICY_VIOLATION, e.what());
    }
}

AgentId Kernel::spawn_agent(const std::string& manifest_toml,
                            const std::optional<SignedManifestEnvelope>& envelope,
                            std::optional<AgentId> parent) {
    ensure_accepting();

    AgentManifest manifest = verify_manifest(manifest_toml, envelope, parent.value_or(KERNEL_AGENT_ID));
    enforce_policy(manifest, parent, parent.value_or(KERNEL_AGENT_ID));

    AgentId id = KERNEL_AGENT_ID;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        id = registry_.spawn(manifest, parent);
        quotas_.register_agent(id, manifest.resources);

        std::string detail = fmt::format("spawned '{}' v{} module={}", manifest.name,
                                         manifest.version, manifest.module);
        if (parent) {
            detail += fmt::format(" parent={}", *parent);
        }
        audit_or_halt(AuditAction::AGENT_SPAWN, id, detail);
    }

    spdlog::info("Agent '{}' spawned (id={})", manifest.name, id);

    emit_internal(TriggerEvent::agent_spawned(id, manifest.name));
    emit_internal(TriggerEvent::lifecycle(id, AgentState::RUNNING));
    return id;
}

void Kernel::kill_agent(AgentId id) {
    ensure_accepting();

    runtime::AgentEntry final_entry;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        final_entry = registry_.kill(id);
        try {
            quotas_.revoke(id);
        } catch (const NotFound&) {
            spdlog::warn("Agent {} had no quota account to close", id);
        }
        size_t dropped = triggers_->remove_for_agent(id);

        audit_or_halt(AuditAction::AGENT_KILL, id,
                      fmt::format("killed '{}' ({} children orphaned, {} triggers removed)",
                                  final_entry.name, final_entry.children.size(), dropped));
    }
    spdlog::info("Agent '{}' killed (id={})", final_entry.name, id);

    emit_internal(TriggerEvent::lifecycle(id, AgentState::KILLED));
}

void Kernel::apply_transition(AgentId id, AgentState to, const std::string& note,
                              AgentState (runtime::AgentRegistry::*change)(AgentId)) {
    ensure_accepting();
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        AgentState from = (registry_.*change)(id);

        std::string detail = fmt::format("{} -> {}", agent_state_to_string(from), agent_state_to_string(to));
        if (!note.empty()) {
            detail += ": " + util::sanitize_detail(note);
        }
        audit_or_halt(AuditAction::AGENT_STATE_CHANGE, id, detail);
        spdlog::debug("Agent {} {}", id, detail);
    }

    emit_internal(TriggerEvent::lifecycle(id, to));
}

void Kernel::pause_agent(AgentId id) {
    apply_transition(id, AgentState::PAUSED, "", &runtime::AgentRegistry::pause);
}

void Kernel::resume_agent(AgentId id) {
    apply_transition(id, AgentState::RUNNING, "", &runtime::AgentRegistry::resume);
}

void Kernel::mark_errored(AgentId id, const std::string& reason) {
    apply_transition(id, AgentState::ERRORED, reason, &runtime::AgentRegistry::mark_errored);
    spdlog::warn("Agent {} errored: {}", id, util::sanitize_detail(reason));
}

void Kernel::recover_agent(AgentId id) {
    apply_transition(id, AgentState::RUNNING, "recovered", &runtime::AgentRegistry::recover);
}

void Kernel::update_capabilities(AgentId id, const std::string& manifest_toml,
                                 const std::optional<SignedManifestEnvelope>& envelope) {
    ensure_accepting();

    auto entry = registry_.get(id);
    if (!entry) {
        throw NotFound(fmt::format("agent {}", id));
    }

    AgentManifest manifest = verify_manifest(manifest_toml, envelope, id);
    if (manifest.name != entry->name) {
        throw SpawnError(SpawnErrorKind::INVALID_MANIFEST,
                         fmt::format("manifest name '{}' does not match agent '{}'",
                                     manifest.name, entry->name),
                         ManifestErrorKind::VALIDATION);
    }
    enforce_policy(manifest, entry->parent, id);

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        registry_.update_manifest(id, manifest);
        quotas_.update_limits(id, manifest.resources);

        audit_or_halt(AuditAction::CONFIG_CHANGE, id,
                      fmt::format("capabilities updated: {} tools, max_llm_tokens_per_hour={}, "
                                  "max_concurrent_tools={}",
                                  manifest.capabilities.tools.size(),
                                  manifest.resources.max_llm_tokens_per_hour,
                                  manifest.resources.max_concurrent_tools));
    }
    spdlog::info("Agent '{}' capabilities updated", manifest.name);
}

std::vector<runtime::AgentEntry> Kernel::list_agents() const {
    return registry_.list();
}

std::optional<runtime::AgentEntry> Kernel::get_agent(AgentId id) const {
    return registry_.get(id);
}

// ============================================================================
// Tool calls, tokens, memory
// ============================================================================

std::shared_ptr<const AgentManifest> Kernel::running_manifest(AgentId agent) {
    auto entry = registry_.get(agent);
    if (!entry) {
        throw NotFound(fmt::format("agent {}", agent));
    }
    if (entry->state != AgentState::RUNNING) {
        throw AgentNotRunning(agent, entry->state);
    }
    return entry->manifest;
}

ToolPermit Kernel::authorize_tool(const ToolInvocationContext& ctx) {
    ensure_accepting();

    auto manifest = running_manifest(ctx.agent);
    std::string tool = util::sanitize_name(ctx.tool);

    try {
        if (config_.policy.blocks(ctx.tool)) {
            throw CapabilityDenied(CapabilityKind::TOOL, tool, ctx.agent);
        }
        CapabilityGuard::check_tool(*manifest, ctx.tool, ctx.agent);
    } catch (const CapabilityDenied& e) {
        spdlog::warn("Agent {} denied tool '{}'", ctx.agent, tool);
        audit_or_halt(AuditAction::CAPABILITY_DENIED, ctx.agent,
                      fmt::format("tool '{}' denied", tool));
        throw;
    }

    ToolSlot slot;
    try {
        slot = quotas_.acquire_tool_slot(ctx.agent);
    } catch (const QuotaExceeded& e) {
        audit_or_halt(AuditAction::QUOTA_EXCEEDED, ctx.agent,
                      fmt::format("tool '{}': {}", tool, e.what()));
        throw;
    }

    // The slot is released by ToolSlot's destructor if this append throws
    AuditEntry invoke = audit_or_halt(AuditAction::TOOL_INVOKE, ctx.agent,
                                      fmt::format("tool={} input={} bytes", tool, ctx.input.size()));
    registry_.touch(ctx.agent);

    ToolPermit permit;
    permit.agent = ctx.agent;
    permit.tool = tool;
    permit.invoke_sequence = invoke.sequence;
    permit.slot = std::move(slot);
    return permit;
}

void Kernel::record_tool_result(ToolPermit& permit, ToolOutcome outcome, const std::string& summary) {
    permit.slot.release();

    std::string detail = fmt::format("tool={} outcome={} invoke={}", permit.tool,
                                     tool_outcome_to_string(outcome), permit.invoke_sequence);
    if (!summary.empty()) {
        detail += ": " + util::sanitize_detail(summary);
    }
    audit_or_halt(AuditAction::TOOL_RESULT, permit.agent, detail);
}

void Kernel::consume_tokens(AgentId agent, uint64_t tokens) {
    ensure_accepting();
    try {
        quotas_.consume_tokens(agent, tokens);
    } catch (const QuotaExceeded& e) {
        audit_or_halt(AuditAction::QUOTA_EXCEEDED, agent, e.what());
        throw;
    }
}

void Kernel::check_memory(AgentId agent, MemoryAccess op, const std::string& key) {
    ensure_accepting();
    auto manifest = running_manifest(agent);
    try {
        CapabilityGuard::check_memory(*manifest, op, key, agent);
    } catch (const CapabilityDenied& e) {
        audit_or_halt(AuditAction::CAPABILITY_DENIED, agent,
                      fmt::format("memory {} '{}' denied", memory_access_to_string(op),
                                  util::sanitize_name(key)));
        throw;
    }
}

QuotaUsage Kernel::quota_usage(AgentId agent) const {
    return quotas_.usage(agent);
}

// ============================================================================
// Triggers
// ============================================================================

TriggerId Kernel::register_trigger(const TriggerDefinition& def) {
    ensure_accepting();
    if (!registry_.is_live(def.agent_id)) {
        throw NotFound(fmt::format("agent {}", def.agent_id));
    }

    TriggerId id = triggers_->register_trigger(def);
    audit_or_halt(AuditAction::CONFIG_CHANGE, def.agent_id,
                  fmt::format("trigger {} registered ({})", id,
                              trigger_pattern_kind_to_string(def.pattern.kind)));
    return id;
}

void Kernel::unregister_trigger(TriggerId id) {
    ensure_accepting();
    auto def = triggers_->get(id);
    if (!def) {
        throw NotFound(fmt::format("trigger {}", id));
    }
    triggers_->unregister(id);
    audit_or_halt(AuditAction::CONFIG_CHANGE, def->agent_id,
                  fmt::format("trigger {} removed", id));
}

std::vector<TriggerDefinition> Kernel::list_triggers() const {
    return triggers_->list();
}

void Kernel::set_action_handler(ActionHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    action_handler_ = std::move(handler);
}

std::vector<FiredAction> Kernel::fire(const TriggerEvent& event) {
    try {
        return triggers_->on_event(event);
    } catch (const LedgerWriteError& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    } catch (const ChainBroken& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    }
}

std::vector<FiredAction> Kernel::admit(std::vector<FiredAction> fired) {
    std::vector<FiredAction> admitted;
    for (auto& action : fired) {
        auto entry = registry_.get(action.agent_id);
        if (!entry || entry->state != AgentState::RUNNING) {
            spdlog::debug("Trigger {} fired for agent {} which is not running; dropped",
                          action.trigger_id, action.agent_id);
            continue;
        }
        try {
            quotas_.consume_tokens(action.agent_id, estimate_prompt_tokens(action.prompt));
        } catch (const QuotaExceeded& e) {
            audit_or_halt(AuditAction::QUOTA_EXCEEDED, action.agent_id,
                          fmt::format("trigger {}: {}", action.trigger_id, e.what()));
            continue;
        } catch (const NotFound&) {
            // Killed between the registry read and the charge
            continue;
        }
        admitted.push_back(std::move(action));
    }

    ActionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = action_handler_;
    }
    if (handler) {
        for (const auto& action : admitted) {
            handler(action);
        }
    }
    return admitted;
}

std::vector<FiredAction> Kernel::dispatch_event(const TriggerEvent& event) {
    ensure_accepting();
    return admit(fire(event));
}

std::vector<FiredAction> Kernel::tick() {
    ensure_accepting();
    try {
        return admit(triggers_->tick());
    } catch (const LedgerWriteError& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    } catch (const ChainBroken& e) {
        enter_halt(e.what());
        throw KernelHalted(e.what());
    }
}

void Kernel::emit_internal(const TriggerEvent& event) {
    if (halted_) {
        return;
    }
    try {
        admit(fire(event));
    } catch (const KernelHalted& e) {
        spdlog::critical("Trigger dispatch for '{}' halted the kernel: {}", event.describe(), e.what());
    }
}

} // namespace bastion::kernel
