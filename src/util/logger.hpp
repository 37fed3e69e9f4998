#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace bastion::util {

// Install the "bastion" console logger as the spdlog default (idempotent)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// "debug", "info", ... ; unknown names map to info
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace bastion::util
