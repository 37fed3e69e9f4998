#include "kernel/config.hpp"
#include <limits>
#include <spdlog/spdlog.h>
#include "util/env.hpp"

namespace bastion::kernel {

nlohmann::json KernelConfig::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level;
    j["audit_log_path"] = audit_log_path;
    j["require_signature"] = verifier.require_signature;
    j["trusted_keys"] = verifier.trusted_keys.size();
    j["policy"] = policy.to_json();
    return j;
}

KernelConfig kernel_config_from_env() {
    KernelConfig config;

    config.log_level = util::get_env_or("BASTION_LOG_LEVEL", config.log_level);
    config.audit_log_path = util::get_env("BASTION_AUDIT_LOG");

    std::string require_signed = util::get_env("BASTION_REQUIRE_SIGNED");
    if (!require_signed.empty()) {
        if (auto flag = util::parse_bool(require_signed)) {
            config.verifier.require_signature = *flag;
        } else {
            spdlog::warn("Ignoring BASTION_REQUIRE_SIGNED={}: expected a boolean", require_signed);
        }
    }
    config.verifier.trusted_keys = util::split_list(util::get_env("BASTION_TRUSTED_KEYS"));

    std::string allowed = util::get_env("BASTION_ALLOWED_TOOLS");
    if (!allowed.empty()) {
        config.policy.allowed_tools = util::split_list(allowed);
    }
    config.policy.blocked_tools = util::split_list(util::get_env("BASTION_BLOCKED_TOOLS"));

    std::string max_tokens = util::get_env("BASTION_MAX_TOKENS_PER_HOUR");
    if (!max_tokens.empty()) {
        if (auto value = util::parse_u64(max_tokens)) {
            config.policy.max_tokens_per_hour = *value;
        } else {
            spdlog::warn("Ignoring BASTION_MAX_TOKENS_PER_HOUR={}: not a number", max_tokens);
        }
    }

    std::string max_tools = util::get_env("BASTION_MAX_CONCURRENT_TOOLS");
    if (!max_tools.empty()) {
        auto value = util::parse_u64(max_tools);
        if (value && *value <= std::numeric_limits<uint32_t>::max()) {
            config.policy.max_concurrent_tools = static_cast<uint32_t>(*value);
        } else {
            spdlog::warn("Ignoring BASTION_MAX_CONCURRENT_TOOLS={}: not a number", max_tools);
        }
    }

    return config;
}

} // namespace bastion::kernel
