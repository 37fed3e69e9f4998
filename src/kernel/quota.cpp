#include "kernel/quota.hpp"
#include <spdlog/spdlog.h>

namespace bastion::kernel {

constexpr std::chrono::hours ResourceQuotaMeter::TOKEN_WINDOW;

struct QuotaAccount {
    std::mutex mutex;
    ResourceLimits limits;
    std::deque<std::pair<QuotaClock::time_point, uint64_t>> consumed;
    uint64_t window_sum = 0;
    uint32_t in_flight = 0;
    bool revoked = false;

    // Drop consumption at or before the window start
    void prune(QuotaClock::time_point now) {
        auto cutoff = now - ResourceQuotaMeter::TOKEN_WINDOW;
        while (!consumed.empty() && consumed.front().first <= cutoff) {
            window_sum -= consumed.front().second;
            consumed.pop_front();
        }
    }
};

// ============================================================================
// ToolSlot
// ============================================================================

ToolSlot::ToolSlot(std::shared_ptr<QuotaAccount> account, AgentId agent)
    : account_(std::move(account)), agent_(agent) {}

ToolSlot::~ToolSlot() {
    release();
}

ToolSlot::ToolSlot(ToolSlot&& other) noexcept
    : account_(std::move(other.account_)), agent_(other.agent_) {
    other.account_.reset();
}

ToolSlot& ToolSlot::operator=(ToolSlot&& other) noexcept {
    if (this != &other) {
        release();
        account_ = std::move(other.account_);
        agent_ = other.agent_;
        other.account_.reset();
    }
    return *this;
}

void ToolSlot::release() noexcept {
    if (!account_) return;
    {
        std::lock_guard<std::mutex> lock(account_->mutex);
        if (account_->in_flight > 0) {
            --account_->in_flight;
        }
    }
    account_.reset();
}

// ============================================================================
// ResourceQuotaMeter
// ============================================================================

nlohmann::json QuotaUsage::to_json() const {
    nlohmann::json j;
    j["agent"] = agent;
    j["tokens_in_window"] = tokens_in_window;
    j["max_tokens_per_hour"] = max_tokens_per_hour;
    j["tools_in_flight"] = tools_in_flight;
    j["max_concurrent_tools"] = max_concurrent_tools;
    return j;
}

ResourceQuotaMeter::ResourceQuotaMeter(NowFn now)
    : now_(std::move(now)) {}

std::shared_ptr<QuotaAccount> ResourceQuotaMeter::account(AgentId agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(agent);
    if (it == accounts_.end()) {
        throw NotFound("quota account for agent " + std::to_string(agent));
    }
    return it->second;
}

void ResourceQuotaMeter::register_agent(AgentId agent, const ResourceLimits& limits) {
    auto acct = std::make_shared<QuotaAccount>();
    acct->limits = limits;

    std::lock_guard<std::mutex> lock(mutex_);
    accounts_[agent] = std::move(acct);
    spdlog::debug("Quota account opened: agent={} tokens/h={} tools={}",
                  agent, limits.max_llm_tokens_per_hour, limits.max_concurrent_tools);
}

void ResourceQuotaMeter::update_limits(AgentId agent, const ResourceLimits& limits) {
    auto acct = account(agent);
    std::lock_guard<std::mutex> lock(acct->mutex);
    if (acct->revoked) {
        throw NotFound("quota account for agent " + std::to_string(agent));
    }
    acct->limits = limits;
}

void ResourceQuotaMeter::revoke(AgentId agent) {
    std::shared_ptr<QuotaAccount> acct;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(agent);
        if (it == accounts_.end()) {
            throw NotFound("quota account for agent " + std::to_string(agent));
        }
        acct = std::move(it->second);
        accounts_.erase(it);
    }

    // Outstanding ToolSlots keep the account alive and release into it
    std::lock_guard<std::mutex> lock(acct->mutex);
    acct->revoked = true;
    spdlog::debug("Quota account closed: agent={} in_flight={}", agent, acct->in_flight);
}

void ResourceQuotaMeter::consume_tokens(AgentId agent, uint64_t n) {
    auto acct = account(agent);
    auto now = now_();

    std::lock_guard<std::mutex> lock(acct->mutex);
    if (acct->revoked) {
        throw NotFound("quota account for agent " + std::to_string(agent));
    }

    acct->prune(now);
    uint64_t limit = acct->limits.max_llm_tokens_per_hour;
    if (n > limit || acct->window_sum > limit - n) {
        spdlog::warn("Token quota exceeded: agent={} used={}/{} requested={}",
                     agent, acct->window_sum, limit, n);
        throw QuotaExceeded(agent, QuotaKind::TOKENS, limit, acct->window_sum, n);
    }

    if (n == 0) return;
    acct->consumed.emplace_back(now, n);
    acct->window_sum += n;
    spdlog::debug("Tokens admitted: agent={} n={} window={}/{}", agent, n, acct->window_sum, limit);
}

ToolSlot ResourceQuotaMeter::acquire_tool_slot(AgentId agent) {
    auto acct = account(agent);

    {
        std::lock_guard<std::mutex> lock(acct->mutex);
        if (acct->revoked) {
            throw NotFound("quota account for agent " + std::to_string(agent));
        }
        uint32_t limit = acct->limits.max_concurrent_tools;
        if (acct->in_flight >= limit) {
            spdlog::warn("Tool slots exhausted: agent={} in_flight={}/{}", agent, acct->in_flight, limit);
            throw QuotaExceeded(agent, QuotaKind::TOOL_SLOTS, limit, acct->in_flight, 1);
        }
        ++acct->in_flight;
    }

    return ToolSlot(std::move(acct), agent);
}

QuotaUsage ResourceQuotaMeter::usage(AgentId agent) const {
    auto acct = account(agent);
    auto now = now_();

    std::lock_guard<std::mutex> lock(acct->mutex);
    acct->prune(now);

    QuotaUsage u;
    u.agent = agent;
    u.tokens_in_window = acct->window_sum;
    u.max_tokens_per_hour = acct->limits.max_llm_tokens_per_hour;
    u.tools_in_flight = acct->in_flight;
    u.max_concurrent_tools = acct->limits.max_concurrent_tools;
    return u;
}

bool ResourceQuotaMeter::is_registered(AgentId agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.count(agent) > 0;
}

} // namespace bastion::kernel
