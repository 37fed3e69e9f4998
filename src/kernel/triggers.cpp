#include "kernel/triggers.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "kernel/capabilities.hpp"
#include "kernel/cron.hpp"
#include "util/crypto.hpp"
#include "util/sanitize.hpp"

namespace bastion::kernel {

using json = nlohmann::json;
using SystemClock = std::chrono::system_clock;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_any(const std::string& param) {
    return param.empty() || param == "*";
}

std::string substitute_event(const std::string& tmpl, const std::string& description) {
    static const std::string placeholder = "{{event}}";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = tmpl.find(placeholder, pos);
        if (hit == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            return out;
        }
        out.append(tmpl, pos, hit - pos);
        out += description;
        pos = hit + placeholder.size();
    }
}

} // namespace

const char* trigger_pattern_kind_to_string(TriggerPatternKind kind) {
    switch (kind) {
        case TriggerPatternKind::LIFECYCLE:       return "Lifecycle";
        case TriggerPatternKind::AGENT_SPAWNED:   return "AgentSpawned";
        case TriggerPatternKind::CONTENT_MATCH:   return "ContentMatch";
        case TriggerPatternKind::SCHEDULE:        return "Schedule";
        case TriggerPatternKind::WEBHOOK:         return "Webhook";
        case TriggerPatternKind::CHANNEL_MESSAGE: return "ChannelMessage";
        default: return "Unknown";
    }
}

std::optional<TriggerPatternKind> trigger_pattern_kind_from_string(const std::string& str) {
    if (str == "Lifecycle")      return TriggerPatternKind::LIFECYCLE;
    if (str == "AgentSpawned")   return TriggerPatternKind::AGENT_SPAWNED;
    if (str == "ContentMatch")   return TriggerPatternKind::CONTENT_MATCH;
    if (str == "Schedule")       return TriggerPatternKind::SCHEDULE;
    if (str == "Webhook")        return TriggerPatternKind::WEBHOOK;
    if (str == "ChannelMessage") return TriggerPatternKind::CHANNEL_MESSAGE;
    return std::nullopt;
}

json TriggerPattern::to_json() const {
    json j;
    j["kind"] = trigger_pattern_kind_to_string(kind);
    // Webhook tokens are credentials
    j["param"] = kind == TriggerPatternKind::WEBHOOK ? std::string("***") : param;
    return j;
}

json TriggerDefinition::to_json() const {
    json j;
    j["id"] = id;
    j["agent_id"] = agent_id;
    j["pattern"] = pattern.to_json();
    j["prompt_template"] = prompt_template;
    j["max_fires"] = max_fires;
    j["fire_count"] = fire_count;
    j["enabled"] = enabled;
    return j;
}

json FiredAction::to_json() const {
    json j;
    j["trigger_id"] = trigger_id;
    j["agent_id"] = agent_id;
    j["pattern"] = trigger_pattern_kind_to_string(pattern);
    j["prompt"] = prompt;
    j["fire_number"] = fire_number;
    return j;
}

// ============================================================================
// Events
// ============================================================================

TriggerEvent TriggerEvent::lifecycle(AgentId agent, AgentState state) {
    TriggerEvent e;
    e.kind = TriggerEventKind::LIFECYCLE;
    e.agent = agent;
    e.state = state;
    e.time = SystemClock::now();
    return e;
}

TriggerEvent TriggerEvent::agent_spawned(AgentId agent, const std::string& name) {
    TriggerEvent e;
    e.kind = TriggerEventKind::AGENT_SPAWNED;
    e.agent = agent;
    e.agent_name = name;
    e.time = SystemClock::now();
    return e;
}

TriggerEvent TriggerEvent::channel_message(const std::string& channel, const std::string& sender,
                                           const std::string& text) {
    TriggerEvent e;
    e.kind = TriggerEventKind::CHANNEL_MESSAGE;
    e.channel = channel;
    e.sender = sender;
    e.text = text;
    e.time = SystemClock::now();
    return e;
}

TriggerEvent TriggerEvent::webhook(const std::string& token, const std::string& body) {
    TriggerEvent e;
    e.kind = TriggerEventKind::WEBHOOK;
    e.token = token;
    e.text = body;
    e.time = SystemClock::now();
    return e;
}

TriggerEvent TriggerEvent::tick(SystemClock::time_point now) {
    TriggerEvent e;
    e.kind = TriggerEventKind::TICK;
    e.time = now;
    return e;
}

std::string TriggerEvent::describe() const {
    std::string text;
    switch (kind) {
        case TriggerEventKind::LIFECYCLE:
            text = "agent " + std::to_string(agent) + " is now " + agent_state_to_string(state);
            break;
        case TriggerEventKind::AGENT_SPAWNED:
            text = "agent '" + agent_name + "' spawned (id " + std::to_string(agent) + ")";
            break;
        case TriggerEventKind::CHANNEL_MESSAGE:
            text = channel + " message" + (sender.empty() ? "" : " from " + sender) + ": " + this->text;
            break;
        case TriggerEventKind::WEBHOOK:
            text = "webhook: " + this->text;
            break;
        case TriggerEventKind::TICK:
            text = "schedule tick at " + format_timestamp(time);
            break;
    }
    return util::sanitize_detail(text);
}

// ============================================================================
// TriggerScheduler
// ============================================================================

struct TriggerScheduler::Compiled {
    TriggerDefinition def;
    std::optional<std::regex> regex;
    std::optional<CronSchedule> schedule;
    std::optional<SystemClock::time_point> next_fire;
    std::optional<AgentState> state;
};

TriggerScheduler::TriggerScheduler(AuditLedger& ledger, NowFn now)
    : ledger_(ledger), now_(std::move(now)) {}

TriggerScheduler::~TriggerScheduler() = default;

TriggerId TriggerScheduler::register_trigger(const TriggerDefinition& def) {
    auto compiled = std::make_unique<Compiled>();
    compiled->def = def;
    compiled->def.fire_count = 0;

    const std::string& param = def.pattern.param;
    switch (def.pattern.kind) {
        case TriggerPatternKind::LIFECYCLE:
            if (!is_any(param)) {
                compiled->state = agent_state_from_string(param);
                if (!compiled->state) {
                    throw InvalidPattern("unknown lifecycle state '" + util::sanitize_name(param) + "'");
                }
            }
            break;

        case TriggerPatternKind::AGENT_SPAWNED:
            if (!is_any(param) && !is_valid_memory_glob(param)) {
                throw InvalidPattern("bad agent name glob '" + util::sanitize_name(param) + "'");
            }
            break;

        case TriggerPatternKind::CONTENT_MATCH:
            if (param.empty()) {
                throw InvalidPattern("content match needs a regex");
            }
            try {
                compiled->regex.emplace(param, std::regex::ECMAScript | std::regex::optimize);
            } catch (const std::regex_error& e) {
                throw InvalidPattern(std::string("regex does not compile: ") + e.what());
            }
            break;

        case TriggerPatternKind::SCHEDULE:
            try {
                compiled->schedule = CronSchedule::parse(param);
            } catch (const std::invalid_argument& e) {
                throw InvalidPattern(std::string("schedule: ") + e.what());
            }
            compiled->next_fire = compiled->schedule->next_after(now_());
            if (!compiled->next_fire) {
                throw InvalidPattern("schedule '" + util::sanitize_name(param) + "' never fires");
            }
            break;

        case TriggerPatternKind::WEBHOOK:
            if (param.empty()) {
                throw InvalidPattern("webhook needs an endpoint token");
            }
            break;

        case TriggerPatternKind::CHANNEL_MESSAGE:
            compiled->def.pattern.param = lowercase(param);
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TriggerId id = next_id_++;
    compiled->def.id = id;
    triggers_[id] = std::move(compiled);

    spdlog::info("Trigger {} registered: agent={} kind={} max_fires={}", id, def.agent_id,
                 trigger_pattern_kind_to_string(def.pattern.kind), def.max_fires);
    return id;
}

void TriggerScheduler::unregister(TriggerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (triggers_.erase(id) == 0) {
        throw NotFound("trigger " + std::to_string(id));
    }
    spdlog::info("Trigger {} unregistered", id);
}

void TriggerScheduler::set_enabled(TriggerId id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end()) {
        throw NotFound("trigger " + std::to_string(id));
    }
    it->second->def.enabled = enabled;
}

size_t TriggerScheduler::remove_for_agent(AgentId agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = triggers_.begin(); it != triggers_.end();) {
        if (it->second->def.agent_id == agent) {
            it = triggers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::info("Removed {} triggers owned by agent {}", removed, agent);
    }
    return removed;
}

std::optional<TriggerDefinition> TriggerScheduler::get(TriggerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end()) return std::nullopt;
    return it->second->def;
}

std::vector<TriggerDefinition> TriggerScheduler::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TriggerDefinition> result;
    for (const auto& [_, trigger] : triggers_) {
        result.push_back(trigger->def);
    }
    return result;
}

std::vector<TriggerDefinition> TriggerScheduler::list_for_agent(AgentId agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TriggerDefinition> result;
    for (const auto& [_, trigger] : triggers_) {
        if (trigger->def.agent_id == agent) {
            result.push_back(trigger->def);
        }
    }
    return result;
}

bool TriggerScheduler::matches(Compiled& trigger, const TriggerEvent& event) {
    const auto& param = trigger.def.pattern.param;

    switch (trigger.def.pattern.kind) {
        case TriggerPatternKind::LIFECYCLE:
            return event.kind == TriggerEventKind::LIFECYCLE &&
                   (!trigger.state || *trigger.state == event.state);

        case TriggerPatternKind::AGENT_SPAWNED:
            return event.kind == TriggerEventKind::AGENT_SPAWNED &&
                   (is_any(param) || CapabilityGuard::glob_matches(param, event.agent_name));

        case TriggerPatternKind::CONTENT_MATCH:
            if (event.kind != TriggerEventKind::CHANNEL_MESSAGE &&
                event.kind != TriggerEventKind::WEBHOOK) {
                return false;
            }
            try {
                auto end = event.text.size() > MAX_MATCH_BYTES
                    ? event.text.begin() + MAX_MATCH_BYTES
                    : event.text.end();
                return std::regex_search(event.text.begin(), end, *trigger.regex);
            } catch (const std::regex_error& e) {
                spdlog::warn("Trigger {}: regex evaluation failed ({}), treating as no match",
                             trigger.def.id, e.what());
                return false;
            }

        case TriggerPatternKind::SCHEDULE:
            return event.kind == TriggerEventKind::TICK && trigger.next_fire &&
                   event.time >= *trigger.next_fire;

        case TriggerPatternKind::WEBHOOK:
            return event.kind == TriggerEventKind::WEBHOOK &&
                   util::constant_time_equals(param, event.token);

        case TriggerPatternKind::CHANNEL_MESSAGE:
            return event.kind == TriggerEventKind::CHANNEL_MESSAGE &&
                   (is_any(param) || param == lowercase(event.channel));
    }
    return false;
}

std::vector<FiredAction> TriggerScheduler::on_event(const TriggerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Compiled*> matched;
    for (auto& [id, trigger] : triggers_) {
        const auto& def = trigger->def;
        if (!def.enabled) continue;
        if (def.max_fires != 0 && def.fire_count >= def.max_fires) continue;
        if (!matches(*trigger, event)) continue;
        matched.push_back(trigger.get());
    }
    if (matched.empty()) {
        return {};
    }

    std::string description = event.describe();
    std::vector<AuditRecord> records;
    records.reserve(matched.size());
    for (const auto* trigger : matched) {
        const auto& def = trigger->def;
        uint32_t fire_number = def.fire_count + 1;
        std::string detail = "trigger " + std::to_string(def.id) + " (" +
                             trigger_pattern_kind_to_string(def.pattern.kind) + ") fire " +
                             std::to_string(fire_number) +
                             (def.max_fires ? "/" + std::to_string(def.max_fires) : "") +
                             ": " + description;
        records.push_back({AuditAction::TRIGGER_FIRED, def.agent_id, util::sanitize_detail(detail)});
    }

    // Every fire of this event is audited as one batch; if it fails none is counted
    ledger_.append_batch(records);

    std::vector<FiredAction> fired;
    fired.reserve(matched.size());
    for (auto* trigger : matched) {
        auto& def = trigger->def;
        def.fire_count++;

        // One fire per crossing, however many boundaries were missed
        if (trigger->schedule) {
            trigger->next_fire = trigger->schedule->next_after(event.time);
        }

        FiredAction action;
        action.trigger_id = def.id;
        action.agent_id = def.agent_id;
        action.pattern = def.pattern.kind;
        action.prompt = substitute_event(def.prompt_template, description);
        action.fire_number = def.fire_count;
        fired.push_back(std::move(action));

        spdlog::info("Trigger {} fired for agent {} ({})", def.id, def.agent_id, def.fire_count);
    }
    return fired;
}

std::vector<FiredAction> TriggerScheduler::tick() {
    return on_event(TriggerEvent::tick(now_()));
}

} // namespace bastion::kernel
