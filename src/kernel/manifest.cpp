#include "kernel/manifest.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "util/crypto.hpp"
#include "util/toml.hpp"

namespace bastion::kernel {

using json = nlohmann::json;

namespace {

constexpr size_t MAX_NAME_LENGTH = 64;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void parse_error(const std::string& message) {
    throw ManifestError(ManifestErrorKind::PARSE, message);
}

[[noreturn]] void validation_error(const std::string& message) {
    throw ManifestError(ManifestErrorKind::VALIDATION, message);
}

std::string read_string(const json& table, const char* key, const std::string& path) {
    const auto& value = table[key];
    if (!value.is_string()) {
        parse_error("'" + path + "' must be a string");
    }
    return value.get<std::string>();
}

std::vector<std::string> read_string_list(const json& table, const char* key, const std::string& path) {
    const auto& value = table[key];
    if (!value.is_array()) {
        parse_error("'" + path + "' must be an array of strings");
    }

    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            parse_error("'" + path + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Integers only; sign is checked by validation so "-1" reports as out of range
int64_t read_integer(const json& table, const char* key, const std::string& path) {
    const auto& value = table[key];
    if (!value.is_number_integer()) {
        parse_error("'" + path + "' must be an integer");
    }
    return value.get<int64_t>();
}

const json& read_table(const json& root, const char* key) {
    const auto& value = root[key];
    if (!value.is_object()) {
        parse_error(std::string("[") + key + "] must be a table");
    }
    return value;
}

std::set<std::string> to_set(const std::vector<std::string>& items) {
    return std::set<std::string>(items.begin(), items.end());
}

} // namespace

// ============================================================================
// Syntax checks
// ============================================================================

bool is_valid_agent_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

bool is_valid_tool_name(const std::string& tool) {
    if (tool == "*") return true;
    if (tool.empty() || tool.size() > MAX_NAME_LENGTH) return false;
    return std::all_of(tool.begin(), tool.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == ':';
    });
}

bool is_valid_memory_glob(const std::string& pattern) {
    if (pattern.empty()) return false;
    for (unsigned char c : pattern) {
        if (c < 0x20 || c == 0x7f || std::isspace(c)) return false;
        switch (c) {
            case '?': case '[': case ']': case '{': case '}': case '\\':
                return false;
            default:
                break;
        }
    }
    return true;
}

// ============================================================================
// Manifest JSON view
// ============================================================================

json manifest_to_json(const AgentManifest& manifest) {
    json j;
    j["name"] = manifest.name;
    j["version"] = manifest.version;
    j["description"] = manifest.description;
    j["author"] = manifest.author;
    j["module"] = manifest.module;
    j["tags"] = manifest.tags;
    j["skills"] = manifest.skills;
    j["mcp_servers"] = manifest.mcp_servers;

    j["model"]["provider"] = manifest.model.provider;
    j["model"]["model"] = manifest.model.model;
    j["model"]["max_tokens"] = manifest.model.max_tokens;
    j["model"]["temperature"] = manifest.model.temperature;
    j["model"]["system_prompt"] = manifest.model.system_prompt;

    j["resources"]["max_llm_tokens_per_hour"] = manifest.resources.max_llm_tokens_per_hour;
    j["resources"]["max_concurrent_tools"] = manifest.resources.max_concurrent_tools;

    j["capabilities"]["tools"] = manifest.capabilities.tools;
    j["capabilities"]["memory_read"] = manifest.capabilities.memory_read;
    j["capabilities"]["memory_write"] = manifest.capabilities.memory_write;
    return j;
}

// ============================================================================
// Signed envelope
// ============================================================================

SignedManifestEnvelope SignedManifestEnvelope::from_json_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        parse_error(std::string("envelope is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        parse_error("envelope must be a JSON object");
    }

    SignedManifestEnvelope env;
    for (const char* field : {"manifest", "signature", "public_key"}) {
        if (!j.contains(field)) {
            parse_error(std::string("envelope is missing '") + field + "'");
        }
    }
    env.manifest = read_string(j, "manifest", "manifest");
    env.signature = read_string(j, "signature", "signature");
    env.public_key = read_string(j, "public_key", "public_key");
    if (j.contains("signer_id")) env.signer_id = read_string(j, "signer_id", "signer_id");
    if (j.contains("content_hash")) env.content_hash = read_string(j, "content_hash", "content_hash");
    return env;
}

json SignedManifestEnvelope::to_json() const {
    json j;
    j["manifest"] = manifest;
    j["signature"] = signature;
    j["public_key"] = public_key;
    if (!signer_id.empty()) j["signer_id"] = signer_id;
    if (!content_hash.empty()) j["content_hash"] = content_hash;
    return j;
}

SignedManifestEnvelope sign_manifest(const std::string& manifest_toml,
                                     const std::string& private_key_hex,
                                     const std::string& signer_id) {
    SignedManifestEnvelope env;
    env.manifest = manifest_toml;
    env.signature = util::ed25519_sign_hex(private_key_hex, manifest_toml);
    env.signer_id = signer_id;
    env.content_hash = util::sha256_hex(manifest_toml);
    env.public_key = util::ed25519_public_key_hex(private_key_hex);
    return env;
}

// ============================================================================
// ManifestVerifier
// ============================================================================

ManifestVerifier::ManifestVerifier(VerifierOptions options)
    : options_(std::move(options)) {
    for (auto& key : options_.trusted_keys) {
        key = lowercase(key);
    }
}

AgentManifest ManifestVerifier::verify(const std::string& manifest_toml,
                                       const std::optional<SignedManifestEnvelope>& envelope) const {
    if (envelope) {
        verify_signature(manifest_toml, *envelope);
    } else if (options_.require_signature) {
        throw ManifestError(ManifestErrorKind::SIGNATURE_INVALID,
                            "a signed envelope is required");
    }

    auto manifest = parse(manifest_toml);
    spdlog::debug("Manifest verified: {} v{} ({})", manifest.name, manifest.version,
                  envelope ? "signed" : "unsigned");
    return manifest;
}

void ManifestVerifier::verify_signature(const std::string& manifest_toml,
                                        const SignedManifestEnvelope& envelope) const {
    auto reject = [](const std::string& why) {
        throw ManifestError(ManifestErrorKind::SIGNATURE_INVALID, why);
    };

    // The signature covers the envelope's bytes; they must be the bytes we parse
    if (envelope.manifest != manifest_toml) {
        reject("envelope does not carry this manifest");
    }

    auto public_key = util::from_hex(envelope.public_key);
    if (!public_key || public_key->size() != util::ED25519_PUBLIC_KEY_SIZE) {
        reject("public key must be 32 bytes of hex");
    }
    auto signature = util::from_hex(envelope.signature);
    if (!signature || signature->size() != util::ED25519_SIGNATURE_SIZE) {
        reject("signature must be 64 bytes of hex");
    }

    if (!options_.trusted_keys.empty()) {
        std::string key = lowercase(envelope.public_key);
        if (std::find(options_.trusted_keys.begin(), options_.trusted_keys.end(), key) ==
            options_.trusted_keys.end()) {
            reject("signer key is not trusted");
        }
    }

    if (!envelope.content_hash.empty() &&
        lowercase(envelope.content_hash) != util::sha256_hex(manifest_toml)) {
        reject("content hash does not match manifest");
    }

    if (!util::ed25519_verify(*public_key, manifest_toml, *signature)) {
        reject("signature does not verify");
    }
}

AgentManifest ManifestVerifier::parse(const std::string& manifest_toml) {
    json root;
    try {
        root = util::parse_toml(manifest_toml);
    } catch (const util::TomlError& e) {
        parse_error(e.what());
    }

    AgentManifest m;

    if (!root.contains("name")) parse_error("missing required key 'name'");
    m.name = read_string(root, "name", "name");
    if (root.contains("version")) m.version = read_string(root, "version", "version");
    if (root.contains("description")) m.description = read_string(root, "description", "description");
    if (root.contains("author")) m.author = read_string(root, "author", "author");
    if (root.contains("module")) m.module = read_string(root, "module", "module");
    if (root.contains("tags")) m.tags = read_string_list(root, "tags", "tags");
    if (root.contains("skills")) m.skills = read_string_list(root, "skills", "skills");
    if (root.contains("mcp_servers")) m.mcp_servers = read_string_list(root, "mcp_servers", "mcp_servers");

    // [model]
    if (root.contains("model")) {
        const auto& model = read_table(root, "model");
        if (model.contains("provider")) m.model.provider = read_string(model, "provider", "model.provider");
        if (model.contains("model")) m.model.model = read_string(model, "model", "model.model");
        if (model.contains("system_prompt")) {
            m.model.system_prompt = read_string(model, "system_prompt", "model.system_prompt");
        }
        if (model.contains("max_tokens")) {
            int64_t v = read_integer(model, "max_tokens", "model.max_tokens");
            if (v <= 0 || v > UINT32_MAX) validation_error("model.max_tokens must be between 1 and 4294967295");
            m.model.max_tokens = static_cast<uint32_t>(v);
        }
        if (model.contains("temperature")) {
            if (!model["temperature"].is_number()) parse_error("'model.temperature' must be a number");
            m.model.temperature = model["temperature"].get<double>();
        }
    }

    // [resources]
    if (root.contains("resources")) {
        const auto& res = read_table(root, "resources");
        if (res.contains("max_llm_tokens_per_hour")) {
            int64_t v = read_integer(res, "max_llm_tokens_per_hour", "resources.max_llm_tokens_per_hour");
            if (v <= 0) validation_error("resources.max_llm_tokens_per_hour must be positive");
            m.resources.max_llm_tokens_per_hour = static_cast<uint64_t>(v);
        }
        if (res.contains("max_concurrent_tools")) {
            int64_t v = read_integer(res, "max_concurrent_tools", "resources.max_concurrent_tools");
            if (v <= 0 || v > UINT32_MAX) validation_error("resources.max_concurrent_tools must be positive");
            m.resources.max_concurrent_tools = static_cast<uint32_t>(v);
        }
    }

    // [capabilities]
    if (root.contains("capabilities")) {
        const auto& caps = read_table(root, "capabilities");
        if (caps.contains("tools")) {
            m.capabilities.tools = to_set(read_string_list(caps, "tools", "capabilities.tools"));
        }
        if (caps.contains("memory_read")) {
            m.capabilities.memory_read = to_set(read_string_list(caps, "memory_read", "capabilities.memory_read"));
        }
        if (caps.contains("memory_write")) {
            m.capabilities.memory_write = to_set(read_string_list(caps, "memory_write", "capabilities.memory_write"));
        }
    }

    validate(m);
    return m;
}

void ManifestVerifier::validate(const AgentManifest& m) {
    if (!is_valid_agent_name(m.name)) {
        validation_error("name must be 1-64 characters of [A-Za-z0-9_.-]");
    }
    if (m.model.max_tokens == 0) {
        validation_error("model.max_tokens must be positive");
    }
    if (!(m.model.temperature >= 0.0 && m.model.temperature <= 2.0)) {
        validation_error("model.temperature must be within [0, 2]");
    }
    if (m.resources.max_llm_tokens_per_hour == 0) {
        validation_error("resources.max_llm_tokens_per_hour must be positive");
    }
    if (m.resources.max_concurrent_tools == 0) {
        validation_error("resources.max_concurrent_tools must be positive");
    }

    for (const auto& tool : m.capabilities.tools) {
        if (!is_valid_tool_name(tool)) {
            validation_error("invalid tool name in capabilities.tools");
        }
    }
    for (const auto& pattern : m.capabilities.memory_read) {
        if (!is_valid_memory_glob(pattern)) {
            validation_error("invalid glob in capabilities.memory_read");
        }
    }
    for (const auto& pattern : m.capabilities.memory_write) {
        if (!is_valid_memory_glob(pattern)) {
            validation_error("invalid glob in capabilities.memory_write");
        }
    }
    for (const auto& skill : m.skills) {
        if (skill.empty()) validation_error("skills entries must be non-empty");
    }
    for (const auto& server : m.mcp_servers) {
        if (server.empty()) validation_error("mcp_servers entries must be non-empty");
    }
}

} // namespace bastion::kernel
