/**
 * Bastion TOML Reader
 *
 * Reads the TOML subset used by agent manifests into a JSON document:
 * bare/quoted/dotted keys, [table] headers, inline tables, basic, literal
 * and multi-line strings, integers, floats, booleans and arrays.
 * Arrays of tables and date-time values are rejected.
 */
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace bastion::util {

class TomlError : public std::runtime_error {
public:
    TomlError(const std::string& message, size_t line)
        : std::runtime_error("line " + std::to_string(line) + ": " + message)
        , line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Parse a TOML document. Throws TomlError on malformed input.
nlohmann::json parse_toml(const std::string& text);

} // namespace bastion::util
