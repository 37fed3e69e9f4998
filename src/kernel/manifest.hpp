/**
 * Bastion Agent Manifest
 *
 * Typed form of the agent manifest TOML and the verifier that produces it.
 * Verification is pure: it never touches kernel state, and callers record
 * the outcome in the audit ledger themselves.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace bastion::kernel {

// [model]
struct ModelConfig {
    std::string provider;
    std::string model;
    uint32_t max_tokens = 4096;
    double temperature = 0.7;
    std::string system_prompt;
};

// [resources]
struct ResourceLimits {
    uint64_t max_llm_tokens_per_hour = 200000;
    uint32_t max_concurrent_tools = 10;
};

// [capabilities]
struct ManifestCapabilities {
    std::set<std::string> tools;          // "*" = every tool; empty = none
    std::set<std::string> memory_read;    // Glob patterns over memory keys
    std::set<std::string> memory_write;

    bool allows_all_tools() const { return tools.count("*") > 0; }
};

struct AgentManifest {
    std::string name;
    std::string version = "0.1.0";
    std::string description;
    std::string author;
    std::string module = "builtin:chat";  // Execution entry point
    std::vector<std::string> tags;
    std::vector<std::string> skills;       // Empty = all installed skills
    std::vector<std::string> mcp_servers;  // Empty = all configured servers

    ModelConfig model;
    ResourceLimits resources;
    ManifestCapabilities capabilities;
};

// Listing form; never used as signed content
nlohmann::json manifest_to_json(const AgentManifest& manifest);

// Signed manifest envelope (JSON on the wire)
struct SignedManifestEnvelope {
    std::string manifest;        // Manifest TOML, verbatim
    std::string signature;       // Hex Ed25519 signature over the manifest bytes
    std::string public_key;      // Hex Ed25519 public key of the signer
    std::string signer_id;       // Optional human label
    std::string content_hash;    // Optional hex SHA-256 of the manifest

    // Throws ManifestError(PARSE) on malformed JSON or missing fields
    static SignedManifestEnvelope from_json_text(const std::string& text);

    nlohmann::json to_json() const;
};

// Sign manifest_toml with an Ed25519 private key (hex)
SignedManifestEnvelope sign_manifest(const std::string& manifest_toml,
                                     const std::string& private_key_hex,
                                     const std::string& signer_id = "");

struct VerifierOptions {
    bool require_signature = false;         // Reject manifests without an envelope
    std::vector<std::string> trusted_keys;  // Hex public keys; empty = any verifying key
};

class ManifestVerifier {
public:
    ManifestVerifier() = default;
    explicit ManifestVerifier(VerifierOptions options);

    // Parse, validate and (when an envelope is given) authenticate a manifest.
    // Throws ManifestError.
    AgentManifest verify(const std::string& manifest_toml,
                         const std::optional<SignedManifestEnvelope>& envelope = std::nullopt) const;

    // Parse + validate without any signature handling
    static AgentManifest parse(const std::string& manifest_toml);

    // Throws ManifestError(VALIDATION)
    static void validate(const AgentManifest& manifest);

    const VerifierOptions& options() const { return options_; }

private:
    VerifierOptions options_;

    void verify_signature(const std::string& manifest_toml,
                          const SignedManifestEnvelope& envelope) const;
};

// Syntactic checks shared by the verifier and the capability guard
bool is_valid_agent_name(const std::string& name);
bool is_valid_tool_name(const std::string& tool);
bool is_valid_memory_glob(const std::string& pattern);

} // namespace bastion::kernel
