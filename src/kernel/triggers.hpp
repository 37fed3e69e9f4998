/**
 * Bastion Trigger Scheduler
 *
 * Standing rules that turn matched events into agent actions. Firing is a
 * single step under the scheduler lock: the TriggerFired entries for every
 * matching trigger are appended as one batch, then the fire counts are
 * incremented, then the actions are emitted.
 * Fired actions are requests only; the kernel authorizes them like any
 * other call.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/audit_log.hpp"
#include "kernel/errors.hpp"
#include "kernel/types.hpp"

namespace bastion::kernel {

using TriggerId = uint64_t;

enum class TriggerPatternKind {
    LIFECYCLE,         // param: target state name, or "" / "*" for any
    AGENT_SPAWNED,     // param: glob over the new agent's name
    CONTENT_MATCH,     // param: ECMAScript regex over message text
    SCHEDULE,          // param: cron expression or "every <n><unit>"
    WEBHOOK,           // param: endpoint token
    CHANNEL_MESSAGE    // param: channel type name, or "" / "*" for any
};

const char* trigger_pattern_kind_to_string(TriggerPatternKind kind);
std::optional<TriggerPatternKind> trigger_pattern_kind_from_string(const std::string& str);

struct TriggerPattern {
    TriggerPatternKind kind = TriggerPatternKind::LIFECYCLE;
    std::string param;

    nlohmann::json to_json() const;
};

struct TriggerDefinition {
    TriggerId id = 0;
    AgentId agent_id = KERNEL_AGENT_ID;
    TriggerPattern pattern;
    std::string prompt_template;   // "{{event}}" is replaced by the event description
    uint32_t max_fires = 0;        // 0 = unlimited
    uint32_t fire_count = 0;
    bool enabled = true;

    nlohmann::json to_json() const;
};

enum class TriggerEventKind {
    LIFECYCLE,
    AGENT_SPAWNED,
    CHANNEL_MESSAGE,
    WEBHOOK,
    TICK
};

struct TriggerEvent {
    TriggerEventKind kind = TriggerEventKind::TICK;
    AgentId agent = KERNEL_AGENT_ID;   // Subject agent for lifecycle/spawn events
    AgentState state = AgentState::RUNNING;
    std::string agent_name;
    std::string channel;               // Channel type name
    std::string sender;
    std::string text;                  // Message text or webhook body
    std::string token;                 // Webhook endpoint token
    std::chrono::system_clock::time_point time;

    static TriggerEvent lifecycle(AgentId agent, AgentState state);
    static TriggerEvent agent_spawned(AgentId agent, const std::string& name);
    static TriggerEvent channel_message(const std::string& channel, const std::string& sender,
                                        const std::string& text);
    static TriggerEvent webhook(const std::string& token, const std::string& body);
    static TriggerEvent tick(std::chrono::system_clock::time_point now);

    // Short, sanitized description used in prompts and audit detail
    std::string describe() const;
};

struct FiredAction {
    TriggerId trigger_id = 0;
    AgentId agent_id = KERNEL_AGENT_ID;
    TriggerPatternKind pattern = TriggerPatternKind::LIFECYCLE;
    std::string prompt;
    uint32_t fire_number = 0;

    nlohmann::json to_json() const;
};

class TriggerScheduler {
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    // ContentMatch regexes only look at this many leading bytes of the text
    static constexpr size_t MAX_MATCH_BYTES = 4096;

    explicit TriggerScheduler(AuditLedger& ledger,
                              NowFn now = [] { return std::chrono::system_clock::now(); });
    ~TriggerScheduler();

    // Compiles the pattern (InvalidPattern on failure) and assigns an id.
    // The definition's id and fire_count are ignored.
    TriggerId register_trigger(const TriggerDefinition& def);

    // Throws NotFound
    void unregister(TriggerId id);
    void set_enabled(TriggerId id, bool enabled);

    // Drop every trigger owned by agent; returns how many were removed
    size_t remove_for_agent(AgentId agent);

    std::optional<TriggerDefinition> get(TriggerId id) const;
    std::vector<TriggerDefinition> list() const;
    std::vector<TriggerDefinition> list_for_agent(AgentId agent) const;

    // Fire every enabled, matching trigger with fires left. The fires are
    // audited as one ledger batch; if that append throws, no trigger is
    // counted and nothing is returned.
    std::vector<FiredAction> on_event(const TriggerEvent& event);

    // on_event(TriggerEvent::tick(now()))
    std::vector<FiredAction> tick();

private:
    struct Compiled;

    AuditLedger& ledger_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<TriggerId, std::unique_ptr<Compiled>> triggers_;
    TriggerId next_id_ = 1;

    bool matches(Compiled& trigger, const TriggerEvent& event);
};

} // namespace bastion::kernel
