#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bastion::util {

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// "1", "true", "yes", "on" (any case) -> true; "0", "false", "no", "off" -> false
std::optional<bool> parse_bool(const std::string& value);

std::optional<uint64_t> parse_u64(const std::string& value);

// Split a comma-separated list, trimming whitespace and dropping empty items
std::vector<std::string> split_list(const std::string& value);

} // namespace bastion::util
