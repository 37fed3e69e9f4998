#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "test_harness.hpp"
#include "kernel/kernel.hpp"
#include "util/crypto.hpp"

using namespace bastion;
using namespace bastion::kernel;
using namespace bastion::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

std::string manifest(const std::string& name,
                     const std::string& tools = "\"web_search\", \"read_file\"",
                     uint64_t tokens = 10000, uint32_t slots = 2) {
    return "name = \"" + name + "\"\n"
           "version = \"1.2.0\"\n"
           "[resources]\n"
           "max_llm_tokens_per_hour = " + std::to_string(tokens) + "\n"
           "max_concurrent_tools = " + std::to_string(slots) + "\n"
           "[capabilities]\n"
           "tools = [" + tools + "]\n"
           "memory_read = [\"notes/*\"]\n"
           "memory_write = [\"notes/shared/*\"]\n";
}

ToolInvocationContext call(AgentId agent, const std::string& tool, const std::string& input = "{}") {
    ToolInvocationContext ctx;
    ctx.agent = agent;
    ctx.tool = tool;
    ctx.input = input;
    return ctx;
}

std::optional<AuditEntry> last_entry(const Kernel& kernel) {
    auto size = kernel.ledger().size();
    if (size == 0) return std::nullopt;
    return kernel.ledger().at(size - 1);
}

size_t count_actions(const Kernel& kernel, AuditAction action) {
    AuditFilter filter;
    filter.action = action;
    return kernel.ledger().query(filter).collect().size();
}

// A sink that can be switched into failure
class SwitchableSink : public AuditSink {
public:
    explicit SwitchableSink(std::shared_ptr<std::atomic<bool>> failing) : failing_(std::move(failing)) {}

    void write(const AuditEntry&) override {
        if (*failing_) {
            throw LedgerWriteError("device unavailable");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> failing_;
};

// Like a file stream with its error bit set: after one failed write it keeps
// failing until recover() succeeds, which needs the device back first
class StickySink : public AuditSink {
public:
    StickySink(std::shared_ptr<std::atomic<bool>> device_down, std::shared_ptr<std::atomic<int>> recoveries)
        : device_down_(std::move(device_down)), recoveries_(std::move(recoveries)) {}

    void write(const AuditEntry&) override {
        if (stuck_ || *device_down_) {
            stuck_ = true;
            throw LedgerWriteError("stream in error state");
        }
    }

    void recover() override {
        ++*recoveries_;
        if (*device_down_) {
            throw LedgerWriteError("device still unavailable");
        }
        stuck_ = false;
    }

private:
    std::shared_ptr<std::atomic<bool>> device_down_;
    std::shared_ptr<std::atomic<int>> recoveries_;
    bool stuck_ = false;
};

TriggerDefinition trigger_for(AgentId agent, TriggerPatternKind kind, const std::string& param,
                              const std::string& prompt = "react to {{event}}") {
    TriggerDefinition def;
    def.agent_id = agent;
    def.pattern.kind = kind;
    def.pattern.param = param;
    def.prompt_template = prompt;
    return def;
}

// ============================================================================
// Spawn
// ============================================================================

void test_spawn_is_audited() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("scout"));

    auto entry = kernel.get_agent(id);
    expect(entry && entry->state == AgentState::RUNNING, "agent Running after spawn");
    expect(kernel.list_agents().size() == 1, "one agent listed");

    auto audit = last_entry(kernel);
    expect(audit && audit->action == AuditAction::AGENT_SPAWN, "spawn audited");
    expect(audit->agent == id, "entry names the agent");
    expect(audit->detail.find("spawned 'scout' v1.2.0") != std::string::npos, "detail names the manifest");
    expect(kernel.quota_usage(id).max_tokens_per_hour == 10000, "quota account opened");
    expect(kernel.verify_ledger().intact, "chain intact");
}

void test_invalid_manifest_rejected_and_audited() {
    Kernel kernel;
    try {
        kernel.spawn_agent("name = \"bad name\"\n");
        expect(false, "invalid manifest spawned");
    } catch (const SpawnError& e) {
        expect(e.kind() == SpawnErrorKind::INVALID_MANIFEST, "invalid manifest kind");
        expect(e.manifest_error() == ManifestErrorKind::VALIDATION, "manifest error carried");
    }
    expect(kernel.list_agents().empty(), "nothing registered");
    expect(count_actions(kernel, AuditAction::MANIFEST_REJECTED) == 1, "rejection audited");
}

void test_policy_violation_rejected() {
    Kernel::Config config;
    config.policy.blocked_tools = {"shell_exec"};
    Kernel kernel(config);

    try {
        kernel.spawn_agent(manifest("rogue", "\"shell_exec\""));
        expect(false, "blocked tool granted");
    } catch (const SpawnError& e) {
        expect(e.kind() == SpawnErrorKind::POLICY_VIOLATION, "policy violation kind");
    }
    expect(kernel.list_agents().empty(), "nothing registered");
    auto audit = last_entry(kernel);
    expect(audit && audit->action == AuditAction::CAPABILITY_DENIED, "denial audited");
    expect(audit->detail.find("rogue") != std::string::npos, "denial names the manifest");
}

void test_child_spawn_checked_against_parent() {
    Kernel kernel;
    AgentId parent = kernel.spawn_agent(manifest("parent", "\"web_search\""));

    AgentId child = kernel.spawn_agent(manifest("child", "\"web_search\"", 5000, 1), std::nullopt, parent);
    expect(kernel.get_agent(child)->parent == parent, "child linked to parent");
    expect(last_entry(kernel)->detail.find("parent=" + std::to_string(parent)) != std::string::npos,
           "spawn detail names the parent");

    try {
        kernel.spawn_agent(manifest("greedy", "\"web_search\", \"shell_exec\""), std::nullopt, parent);
        expect(false, "child exceeded parent");
    } catch (const SpawnError& e) {
        expect(e.kind() == SpawnErrorKind::POLICY_VIOLATION, "escalation is a policy violation");
    }

    try {
        kernel.spawn_agent(manifest("lost"), std::nullopt, 4242);
        expect(false, "missing parent accepted");
    } catch (const SpawnError& e) {
        expect(e.kind() == SpawnErrorKind::PARENT_NOT_FOUND, "parent not found kind");
    }
    expect(kernel.list_agents().size() == 2, "only parent and child live");
}

void test_signature_required() {
    auto keys = util::generate_ed25519_keypair();
    Kernel::Config config;
    config.verifier.require_signature = true;
    config.verifier.trusted_keys = {keys.public_key_hex};
    Kernel kernel(config);

    const std::string toml = manifest("signed");
    try {
        kernel.spawn_agent(toml);
        expect(false, "unsigned manifest spawned");
    } catch (const SpawnError& e) {
        expect(e.manifest_error() == ManifestErrorKind::SIGNATURE_INVALID, "signature failure carried");
    }

    auto envelope = sign_manifest(toml, keys.private_key_hex, "release");
    AgentId id = kernel.spawn_agent(toml, envelope);
    expect(kernel.get_agent(id)->name == "signed", "signed manifest spawned");
}

// ============================================================================
// Tool calls
// ============================================================================

void test_authorized_tool_call() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("worker"));

    ToolPermit permit = kernel.authorize_tool(call(id, "web_search", "{\"q\":\"weather\"}"));
    auto invoke = kernel.ledger().at(permit.invoke_sequence);
    expect(invoke && invoke->action == AuditAction::TOOL_INVOKE, "invoke audited");
    expect(invoke->detail == "tool=web_search input=15 bytes", "input size recorded, never its content");
    expect(kernel.quota_usage(id).tools_in_flight == 1, "slot held");

    kernel.record_tool_result(permit, ToolOutcome::SUCCESS, "3 results");
    expect(kernel.quota_usage(id).tools_in_flight == 0, "slot released");
    auto result = last_entry(kernel);
    expect(result->action == AuditAction::TOOL_RESULT, "result audited");
    expect(result->detail == "tool=web_search outcome=success invoke=" +
                             std::to_string(permit.invoke_sequence) + ": 3 results",
           "result detail links the invoke");
}

void test_denied_tool_is_audited() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("worker"));
    try {
        kernel.authorize_tool(call(id, "shell_exec"));
        expect(false, "ungranted tool authorized");
    } catch (const CapabilityDenied& e) {
        expect(e.kind() == CapabilityKind::TOOL && e.capability() == "shell_exec", "denial names the tool");
    }
    auto audit = last_entry(kernel);
    expect(audit->action == AuditAction::CAPABILITY_DENIED, "denial audited");
    expect(audit->detail == "tool 'shell_exec' denied", "denial detail");
    expect(count_actions(kernel, AuditAction::TOOL_INVOKE) == 0, "nothing invoked");
    expect(kernel.quota_usage(id).tools_in_flight == 0, "no slot taken");
}

void test_blocked_tool_under_wildcard_grant() {
    Kernel::Config config;
    config.policy.blocked_tools = {"shell_exec"};
    Kernel kernel(config);
    AgentId id = kernel.spawn_agent(manifest("admin", "\"*\""));

    expect_throws<CapabilityDenied>([&] { kernel.authorize_tool(call(id, "shell_exec")); },
                                    "blocked tool denied through wildcard");
    ToolPermit permit = kernel.authorize_tool(call(id, "anything_else"));
    kernel.record_tool_result(permit, ToolOutcome::SUCCESS);
}

void test_tool_slot_quota() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("single", "\"web_search\"", 10000, 1));

    ToolPermit first = kernel.authorize_tool(call(id, "web_search"));
    try {
        kernel.authorize_tool(call(id, "web_search"));
        expect(false, "second concurrent call authorized");
    } catch (const QuotaExceeded& e) {
        expect(e.kind() == QuotaKind::TOOL_SLOTS, "slot quota kind");
    }
    expect(last_entry(kernel)->action == AuditAction::QUOTA_EXCEEDED, "quota rejection audited");

    kernel.record_tool_result(first, ToolOutcome::TIMEOUT);
    expect(last_entry(kernel)->detail.find("outcome=timeout") != std::string::npos, "timeout recorded");

    {
        ToolPermit dropped = kernel.authorize_tool(call(id, "web_search"));
    }
    expect(kernel.quota_usage(id).tools_in_flight == 0, "destroyed permit releases its slot");
    ToolPermit again = kernel.authorize_tool(call(id, "web_search"));
    kernel.record_tool_result(again, ToolOutcome::CANCELLED);
}

void test_token_quota_is_audited() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("chatty", "\"web_search\"", 1000, 1));
    kernel.consume_tokens(id, 900);
    expect_throws<QuotaExceeded>([&] { kernel.consume_tokens(id, 200); }, "over the hourly limit");
    expect(last_entry(kernel)->action == AuditAction::QUOTA_EXCEEDED, "quota rejection audited");
    expect(kernel.quota_usage(id).tokens_in_window == 900, "rejected tokens not charged");
    expect_throws<NotFound>([&] { kernel.consume_tokens(999, 1); }, "unknown agent");
}

void test_memory_checks() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("reader"));
    kernel.check_memory(id, MemoryAccess::READ, "notes/today");
    kernel.check_memory(id, MemoryAccess::WRITE, "notes/shared/log");
    try {
        kernel.check_memory(id, MemoryAccess::WRITE, "notes/today");
        expect(false, "write outside grant");
    } catch (const CapabilityDenied& e) {
        expect(e.kind() == CapabilityKind::MEMORY_WRITE, "memory write denial");
    }
    expect(last_entry(kernel)->detail == "memory write 'notes/today' denied", "memory denial audited");
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_pause_blocks_tool_calls() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("worker"));
    kernel.pause_agent(id);
    expect(last_entry(kernel)->detail == "Running -> Paused", "pause audited");

    try {
        kernel.authorize_tool(call(id, "web_search"));
        expect(false, "paused agent authorized");
    } catch (const AgentNotRunning& e) {
        expect(e.state() == AgentState::PAUSED, "reports the state");
    }
    expect_throws<AgentNotRunning>([&] { kernel.check_memory(id, MemoryAccess::READ, "notes/x"); },
                                   "paused agent memory access");
    expect_throws<InvalidTransition>([&] { kernel.pause_agent(id); }, "pause twice");

    kernel.resume_agent(id);
    ToolPermit permit = kernel.authorize_tool(call(id, "web_search"));
    kernel.record_tool_result(permit, ToolOutcome::SUCCESS);
}

void test_error_and_recover() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("flaky"));
    kernel.mark_errored(id, "module crashed");
    expect(kernel.get_agent(id)->state == AgentState::ERRORED, "Errored");
    expect(last_entry(kernel)->detail == "Running -> Errored: module crashed", "error audited with reason");
    expect_throws<InvalidTransition>([&] { kernel.resume_agent(id); }, "resume is not recover");

    kernel.recover_agent(id);
    expect(kernel.get_agent(id)->state == AgentState::RUNNING, "recovered");
    expect(last_entry(kernel)->detail == "Errored -> Running: recovered", "recover audited");
}

void test_kill_removes_agent_and_triggers() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("victim"));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::WEBHOOK, "hook"));
    expect(kernel.list_triggers().size() == 1, "trigger registered");

    kernel.kill_agent(id);
    expect(!kernel.get_agent(id), "agent gone");
    expect(kernel.list_triggers().empty(), "triggers removed with their agent");
    auto kill = kernel.ledger().query(AuditFilter{AuditAction::AGENT_KILL, id, 0, 0}).collect();
    expect(kill.size() == 1, "kill audited once");
    expect(kill[0].detail == "killed 'victim' (0 children orphaned, 1 triggers removed)", "kill detail");

    expect_throws<NotFound>([&] { kernel.kill_agent(id); }, "double kill");
    expect_throws<NotFound>([&] { kernel.authorize_tool(call(id, "web_search")); }, "tool call after kill");
    expect_throws<NotFound>([&] { kernel.quota_usage(id); }, "quota account closed");
}

void test_update_capabilities() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("grower", "\"web_search\""));
    expect_throws<CapabilityDenied>([&] { kernel.authorize_tool(call(id, "read_file")); }, "not yet granted");

    kernel.update_capabilities(id, manifest("grower", "\"web_search\", \"read_file\"", 20000, 4));
    ToolPermit permit = kernel.authorize_tool(call(id, "read_file"));
    kernel.record_tool_result(permit, ToolOutcome::SUCCESS);
    expect(kernel.quota_usage(id).max_tokens_per_hour == 20000, "limits updated");
    expect(count_actions(kernel, AuditAction::CONFIG_CHANGE) == 1, "update audited");

    try {
        kernel.update_capabilities(id, manifest("impostor"));
        expect(false, "renamed manifest accepted");
    } catch (const SpawnError& e) {
        expect(e.kind() == SpawnErrorKind::INVALID_MANIFEST, "name mismatch kind");
    }
    expect_throws<NotFound>([&] { kernel.update_capabilities(999, manifest("ghost")); }, "unknown agent");
}

// ============================================================================
// Triggers
// ============================================================================

void test_trigger_registration() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("listener"));
    expect_throws<NotFound>([&] { kernel.register_trigger(trigger_for(999, TriggerPatternKind::WEBHOOK, "t")); },
                            "trigger for unknown agent");
    expect_throws<InvalidPattern>([&] {
        kernel.register_trigger(trigger_for(id, TriggerPatternKind::CONTENT_MATCH, "("));
    }, "bad regex");

    TriggerId tid = kernel.register_trigger(trigger_for(id, TriggerPatternKind::WEBHOOK, "t"));
    expect(last_entry(kernel)->detail == "trigger " + std::to_string(tid) + " registered (Webhook)",
           "registration audited");
    kernel.unregister_trigger(tid);
    expect(kernel.list_triggers().empty(), "unregistered");
    expect_throws<NotFound>([&] { kernel.unregister_trigger(tid); }, "unregister twice");
}

void test_dispatch_admits_running_agents() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("responder"));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::CHANNEL_MESSAGE, "telegram"));

    std::vector<FiredAction> handled;
    kernel.set_action_handler([&](const FiredAction& action) { handled.push_back(action); });

    auto admitted = kernel.dispatch_event(TriggerEvent::channel_message("telegram", "alice", "hi"));
    expect(admitted.size() == 1, "admitted");
    expect(admitted[0].prompt == "react to telegram message from alice: hi", "prompt rendered");
    expect(handled.size() == 1 && handled[0].agent_id == id, "handler received the action");
    expect(kernel.quota_usage(id).tokens_in_window == admitted[0].prompt.size() / 4 + 1,
           "prompt cost charged");

    kernel.pause_agent(id);
    admitted = kernel.dispatch_event(TriggerEvent::channel_message("telegram", "alice", "again"));
    expect(admitted.empty(), "paused agent's action dropped");
    expect(count_actions(kernel, AuditAction::TRIGGER_FIRED) == 2, "both fires audited");
    expect(handled.size() == 1, "handler not called for dropped actions");
}

void test_dispatch_respects_token_quota() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("tight", "\"web_search\"", 10, 1));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::WEBHOOK, "tok",
                                        "a long prompt that costs more than ten tokens: {{event}}"));

    auto admitted = kernel.dispatch_event(TriggerEvent::webhook("tok", "payload"));
    expect(admitted.empty(), "over-quota action not admitted");
    expect(last_entry(kernel)->action == AuditAction::QUOTA_EXCEEDED, "rejection audited");
}

void test_internal_lifecycle_events_fire_triggers() {
    Kernel kernel;
    AgentId watcher = kernel.spawn_agent(manifest("watcher"));
    AgentId worker = kernel.spawn_agent(manifest("worker"));
    kernel.register_trigger(trigger_for(watcher, TriggerPatternKind::LIFECYCLE, "Errored",
                                        "investigate: {{event}}"));
    kernel.register_trigger(trigger_for(watcher, TriggerPatternKind::AGENT_SPAWNED, "helper-*"));

    std::vector<FiredAction> handled;
    kernel.set_action_handler([&](const FiredAction& action) { handled.push_back(action); });

    kernel.mark_errored(worker, "timeout");
    expect(handled.size() == 1, "lifecycle trigger fired from a kernel operation");
    expect(handled[0].prompt == "investigate: agent " + std::to_string(worker) + " is now Errored",
           "lifecycle prompt");

    kernel.spawn_agent(manifest("helper-1"));
    expect(handled.size() == 2 && handled[1].pattern == TriggerPatternKind::AGENT_SPAWNED,
           "spawn trigger fired");
}

void test_tick_uses_trigger_clock() {
    auto now = std::make_shared<std::chrono::system_clock::time_point>(
        std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)));
    Kernel kernel(Kernel::Config(), std::make_unique<AuditLedger>(),
                  [] { return QuotaClock::now(); },
                  [now] { return *now; });
    AgentId id = kernel.spawn_agent(manifest("cron"));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::SCHEDULE, "every 5m", "hourly report"));

    expect(kernel.tick().empty(), "not due");
    *now += 5min;
    auto admitted = kernel.tick();
    expect(admitted.size() == 1 && admitted[0].prompt == "hourly report", "due schedule admitted");
    expect(kernel.tick().empty(), "not due again");
}

void test_large_channel_message() {
    Kernel kernel;
    AgentId id = kernel.spawn_agent(manifest("listener"));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::CHANNEL_MESSAGE, "telegram"));
    kernel.register_trigger(trigger_for(id, TriggerPatternKind::CONTENT_MATCH, "bearer"));

    std::string text = "Authorization: bearer " + std::string(120000, 'A');
    auto admitted = kernel.dispatch_event(TriggerEvent::channel_message("telegram", "u", text));
    expect(admitted.size() == 2, "both triggers fire on a 120 KB message");
    for (const auto& action : admitted) {
        expect(action.prompt.find("[REDACTED]") != std::string::npos, "token redacted in the prompt");
        expect(action.prompt.size() < 512, "prompt bounded");
    }
    expect(!kernel.halted(), "kernel still running");

    // Nothing matches, but the event is still evaluated
    expect(kernel.dispatch_event(TriggerEvent::channel_message("slack", "u", std::string(200000, 'B'))).empty(),
           "unmatched large message");
}

// ============================================================================
// Concurrency
// ============================================================================

void test_concurrent_spawn_and_kill() {
    Kernel kernel;
    constexpr int AGENTS = 200;
    std::atomic<bool> spawning{true};
    std::atomic<int> kills{0};
    std::atomic<int> failures{0};

    std::thread killer([&] {
        auto sweep = [&] {
            for (const auto& agent : kernel.list_agents()) {
                try {
                    kernel.kill_agent(agent.id);
                    ++kills;
                } catch (const KernelError&) {
                    ++failures;
                }
            }
        };
        while (spawning) sweep();
        sweep();
    });

    for (int i = 0; i < AGENTS; ++i) {
        try {
            kernel.spawn_agent(manifest("worker-" + std::to_string(i)));
        } catch (const KernelError&) {
            ++failures;
        }
    }
    spawning = false;
    killer.join();

    expect(failures == 0, "no spawn or kill failed");
    expect(kills == AGENTS, "every agent killed once");
    expect(kernel.list_agents().empty(), "no live agents left");
    expect(!kernel.halted(), "not halted");
    expect(count_actions(kernel, AuditAction::AGENT_SPAWN) == AGENTS, "every spawn audited");
    expect(count_actions(kernel, AuditAction::AGENT_KILL) == AGENTS, "every kill audited");

    std::map<AgentId, uint64_t> spawned_at;
    for (const auto& entry : kernel.ledger().query(AuditFilter{AuditAction::AGENT_SPAWN, std::nullopt, 0, 0}).collect()) {
        spawned_at[entry.agent] = entry.sequence;
    }
    bool ordered = true;
    for (const auto& entry : kernel.ledger().query(AuditFilter{AuditAction::AGENT_KILL, std::nullopt, 0, 0}).collect()) {
        auto it = spawned_at.find(entry.agent);
        if (it == spawned_at.end() || it->second > entry.sequence) ordered = false;
    }
    expect(ordered, "each kill recorded after its spawn");
    expect(kernel.verify_ledger().intact, "chain intact");
}

// ============================================================================
// Ledger health
// ============================================================================

void test_ledger_failure_halts_kernel() {
    auto failing = std::make_shared<std::atomic<bool>>(false);
    Kernel kernel(Kernel::Config(), std::make_unique<AuditLedger>(std::make_unique<SwitchableSink>(failing)));
    AgentId id = kernel.spawn_agent(manifest("steady"));

    *failing = true;
    expect_throws<KernelHalted>([&] { kernel.pause_agent(id); }, "unaudited mutation halts");
    expect(kernel.halted(), "halted");
    expect(kernel.halt_reason().find("device unavailable") != std::string::npos, "reason kept");

    *failing = false;
    expect_throws<KernelHalted>([&] { kernel.spawn_agent(manifest("next")); }, "spawn refused");
    expect_throws<KernelHalted>([&] { kernel.authorize_tool(call(id, "web_search")); }, "tools refused");
    expect_throws<KernelHalted>([&] { kernel.dispatch_event(TriggerEvent::webhook("x", "y")); },
                                "events refused");

    auto verification = kernel.confirm_ledger_health();
    expect(verification.intact, "in-memory chain still intact");
    expect(!kernel.halted() && kernel.halt_reason().empty(), "halt cleared");
    kernel.spawn_agent(manifest("next"));
    expect(kernel.verify_ledger().intact, "chain intact after resume");
}

void test_recovery_resets_failed_sink() {
    auto down = std::make_shared<std::atomic<bool>>(false);
    auto recoveries = std::make_shared<std::atomic<int>>(0);
    Kernel kernel(Kernel::Config(), std::make_unique<AuditLedger>(std::make_unique<StickySink>(down, recoveries)));
    AgentId id = kernel.spawn_agent(manifest("durable"));

    *down = true;
    expect_throws<KernelHalted>([&] { kernel.pause_agent(id); }, "failed write halts");

    expect_throws<LedgerWriteError>([&] { kernel.confirm_ledger_health(); }, "device still down");
    expect(kernel.halted(), "stays halted while the sink cannot recover");

    *down = false;
    kernel.confirm_ledger_health();
    expect(*recoveries == 2, "sink asked to recover on each confirmation");
    expect(!kernel.halted(), "halt cleared");

    kernel.resume_agent(id);
    AgentId next = kernel.spawn_agent(manifest("after"));
    expect(kernel.get_agent(id)->state == AgentState::RUNNING, "mutations audited again");
    expect(last_entry(kernel)->agent == next, "spawn after recovery recorded");
    expect(kernel.verify_ledger().intact, "chain intact");
}

void test_file_ledger_recovers_after_torn_write() {
    auto path = (fs::temp_directory_path() / "bastion_kernel_torn.jsonl").string();
    fs::remove(path);
    {
        Kernel::Config config;
        config.audit_log_path = path;
        Kernel kernel(config);
        kernel.spawn_agent(manifest("first"));
        {
            std::ofstream torn(path, std::ios::app | std::ios::binary);
            torn << "{\"action\":\"AgentSp";
        }
        kernel.confirm_ledger_health();
        kernel.spawn_agent(manifest("second"));
    }

    Kernel::Config config;
    config.audit_log_path = path;
    Kernel kernel(config);
    expect(!kernel.halted(), "restart finds no partial record");
    expect(kernel.ledger().size() == 2, "both spawns persisted");
    fs::remove(path);
}

void test_broken_ledger_file_halts_at_startup() {
    auto path = (fs::temp_directory_path() / "bastion_kernel_broken.jsonl").string();
    fs::remove(path);
    {
        Kernel::Config config;
        config.audit_log_path = path;
        Kernel kernel(config);
        kernel.spawn_agent(manifest("a"));
        kernel.spawn_agent(manifest("b"));
        kernel.spawn_agent(manifest("c"));
    }

    std::vector<std::string> lines;
    {
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
    }
    expect(lines.size() == 3, "three spawns persisted");
    auto j = nlohmann::json::parse(lines[1]);
    j["agent"] = 99;
    lines[1] = j.dump();
    {
        std::ofstream out(path, std::ios::trunc);
        for (const auto& line : lines) out << line << "\n";
    }

    Kernel::Config config;
    config.audit_log_path = path;
    Kernel kernel(config);
    expect(kernel.halted(), "tampered ledger halts the kernel");
    expect_throws<KernelHalted>([&] { kernel.spawn_agent(manifest("d")); }, "no mutations");
    try {
        kernel.confirm_ledger_health();
        expect(false, "broken chain confirmed");
    } catch (const ChainBroken& e) {
        expect(e.at_sequence() == 1, "break located");
    }
    expect(kernel.halted(), "still halted");
    fs::remove(path);
}

void test_file_ledger_survives_restart() {
    auto path = (fs::temp_directory_path() / "bastion_kernel_restart.jsonl").string();
    fs::remove(path);
    std::string tip;
    {
        Kernel::Config config;
        config.audit_log_path = path;
        Kernel kernel(config);
        AgentId id = kernel.spawn_agent(manifest("persistent"));
        ToolPermit permit = kernel.authorize_tool(call(id, "web_search"));
        kernel.record_tool_result(permit, ToolOutcome::FAILURE, "HTTP 503");
        tip = kernel.ledger().tip();
    }

    Kernel::Config config;
    config.audit_log_path = path;
    Kernel kernel(config);
    expect(!kernel.halted(), "intact ledger accepted");
    expect(kernel.ledger().size() == 3 && kernel.ledger().tip() == tip, "history reloaded");
    kernel.spawn_agent(manifest("persistent"));
    expect(kernel.ledger().at(3)->sequence == 3, "sequence continues across restarts");
    fs::remove(path);
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_from_env() {
    setenv("BASTION_LOG_LEVEL", "debug", 1);
    setenv("BASTION_REQUIRE_SIGNED", "yes", 1);
    setenv("BASTION_TRUSTED_KEYS", "aa11, bb22 ,", 1);
    setenv("BASTION_BLOCKED_TOOLS", "shell_exec,rm", 1);
    setenv("BASTION_MAX_TOKENS_PER_HOUR", "50000", 1);
    setenv("BASTION_MAX_CONCURRENT_TOOLS", "lots", 1);

    auto config = kernel_config_from_env();
    expect(config.log_level == "debug", "log level");
    expect(config.verifier.require_signature, "signatures required");
    expect(config.verifier.trusted_keys == std::vector<std::string>{"aa11", "bb22"}, "trusted keys trimmed");
    expect(config.policy.blocks("rm") && config.policy.blocks("shell_exec"), "blocked tools");
    expect(config.policy.allowed_tools == std::vector<std::string>{"*"}, "allowlist default");
    expect(config.policy.max_tokens_per_hour == 50000, "token ceiling");
    expect(config.policy.max_concurrent_tools == 0, "bad number ignored");
    expect(config.to_json()["trusted_keys"] == 2, "json reports key count only");

    for (const char* name : {"BASTION_LOG_LEVEL", "BASTION_REQUIRE_SIGNED", "BASTION_TRUSTED_KEYS",
                             "BASTION_BLOCKED_TOOLS", "BASTION_MAX_TOKENS_PER_HOUR",
                             "BASTION_MAX_CONCURRENT_TOOLS"}) {
        unsetenv(name);
    }
    auto defaults = kernel_config_from_env();
    expect(defaults.log_level == "info" && !defaults.verifier.require_signature, "defaults restored");
    expect(defaults.audit_log_path.empty(), "in-memory ledger by default");
}

} // anonymous namespace

int main() {
    quiet_logs();
    std::cout << "=== Bastion Kernel Tests ===\n";

    std::cout << "\n[Spawn]\n";
    run_test("spawn is audited", test_spawn_is_audited);
    run_test("invalid manifest rejected", test_invalid_manifest_rejected_and_audited);
    run_test("policy violation rejected", test_policy_violation_rejected);
    run_test("child checked against parent", test_child_spawn_checked_against_parent);
    run_test("signature required", test_signature_required);

    std::cout << "\n[Tool calls]\n";
    run_test("authorized tool call", test_authorized_tool_call);
    run_test("denied tool audited", test_denied_tool_is_audited);
    run_test("blocked tool under wildcard", test_blocked_tool_under_wildcard_grant);
    run_test("tool slot quota", test_tool_slot_quota);
    run_test("token quota audited", test_token_quota_is_audited);
    run_test("memory checks", test_memory_checks);

    std::cout << "\n[Lifecycle]\n";
    run_test("pause blocks tool calls", test_pause_blocks_tool_calls);
    run_test("error and recover", test_error_and_recover);
    run_test("kill removes agent and triggers", test_kill_removes_agent_and_triggers);
    run_test("update capabilities", test_update_capabilities);

    std::cout << "\n[Triggers]\n";
    run_test("registration", test_trigger_registration);
    run_test("dispatch admits running agents", test_dispatch_admits_running_agents);
    run_test("dispatch respects token quota", test_dispatch_respects_token_quota);
    run_test("internal lifecycle events", test_internal_lifecycle_events_fire_triggers);
    run_test("tick uses trigger clock", test_tick_uses_trigger_clock);
    run_test("large channel message", test_large_channel_message);

    std::cout << "\n[Concurrency]\n";
    run_test("concurrent spawn and kill", test_concurrent_spawn_and_kill);

    std::cout << "\n[Ledger health]\n";
    run_test("ledger failure halts kernel", test_ledger_failure_halts_kernel);
    run_test("recovery resets failed sink", test_recovery_resets_failed_sink);
    run_test("file ledger recovers after torn write", test_file_ledger_recovers_after_torn_write);
    run_test("broken ledger file halts at startup", test_broken_ledger_file_halts_at_startup);
    run_test("file ledger survives restart", test_file_ledger_survives_restart);

    std::cout << "\n[Config]\n";
    run_test("config from environment", test_config_from_env);

    return finish("kernel");
}
