/**
 * Bastion Resource Quotas
 *
 * Per-agent token rate (rolling one-hour window) and tool concurrency.
 * Each agent's account has its own lock so unrelated agents never contend;
 * the meter-wide lock only guards the account map.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "kernel/manifest.hpp"

namespace bastion::kernel {

using QuotaClock = std::chrono::steady_clock;

struct QuotaAccount;

// Scoped tool-concurrency slot. Releases exactly once: on release(),
// destruction, or when moved-from ownership ends.
class ToolSlot {
public:
    ToolSlot() = default;
    ~ToolSlot();

    ToolSlot(ToolSlot&& other) noexcept;
    ToolSlot& operator=(ToolSlot&& other) noexcept;
    ToolSlot(const ToolSlot&) = delete;
    ToolSlot& operator=(const ToolSlot&) = delete;

    void release() noexcept;
    bool held() const { return account_ != nullptr; }
    AgentId agent() const { return agent_; }

private:
    friend class ResourceQuotaMeter;
    ToolSlot(std::shared_ptr<QuotaAccount> account, AgentId agent);

    std::shared_ptr<QuotaAccount> account_;
    AgentId agent_ = KERNEL_AGENT_ID;
};

struct QuotaUsage {
    AgentId agent = KERNEL_AGENT_ID;
    uint64_t tokens_in_window = 0;
    uint64_t max_tokens_per_hour = 0;
    uint32_t tools_in_flight = 0;
    uint32_t max_concurrent_tools = 0;

    nlohmann::json to_json() const;
};

class ResourceQuotaMeter {
public:
    using NowFn = std::function<QuotaClock::time_point()>;

    static constexpr std::chrono::hours TOKEN_WINDOW{1};

    explicit ResourceQuotaMeter(NowFn now = [] { return QuotaClock::now(); });

    // Open an account with the manifest's declared limits
    void register_agent(AgentId agent, const ResourceLimits& limits);

    // New limits apply to future admissions; consumption history is kept
    void update_limits(AgentId agent, const ResourceLimits& limits);

    // Close the account; later admissions throw NotFound
    void revoke(AgentId agent);

    // Admit n tokens against the rolling window or throw QuotaExceeded
    void consume_tokens(AgentId agent, uint64_t n);

    // Take a tool slot or throw QuotaExceeded. Never blocks.
    ToolSlot acquire_tool_slot(AgentId agent);

    QuotaUsage usage(AgentId agent) const;
    bool is_registered(AgentId agent) const;

private:
    NowFn now_;
    mutable std::mutex mutex_;  // Guards accounts_ only
    std::unordered_map<AgentId, std::shared_ptr<QuotaAccount>> accounts_;

    std::shared_ptr<QuotaAccount> account(AgentId agent) const;
};

} // namespace bastion::kernel
