#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/capabilities.hpp"
#include "kernel/manifest.hpp"

namespace bastion::kernel {

struct KernelConfig {
    std::string log_level = "info";
    std::string audit_log_path;   // Empty = in-memory ledger
    VerifierOptions verifier;
    CapabilityPolicy policy;

    nlohmann::json to_json() const;
};

// Defaults overlaid with BASTION_* environment variables
KernelConfig kernel_config_from_env();

} // namespace bastion::kernel
