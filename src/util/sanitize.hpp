#pragma once
#include <cstddef>
#include <string>

namespace bastion::util {

// Truncate to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& text, size_t max_bytes);

// Replace invalid UTF-8 sequences with U+FFFD
std::string to_valid_utf8(const std::string& text);

// Mask credential-looking fragments (bearer tokens, api keys, key=value secrets).
// Single left-to-right pass.
std::string redact_secrets(const std::string& text);

// Audit/log detail: valid UTF-8, secrets redacted, control characters
// replaced by spaces, capped at max_bytes. Only the first 4 * max_bytes of
// input are examined.
std::string sanitize_detail(const std::string& text, size_t max_bytes = 256);

// Tool and capability names for display: control characters stripped, 64 bytes max
std::string sanitize_name(const std::string& name);

} // namespace bastion::util
