/**
 * Bastion Crypto Helpers
 *
 * Thin RAII wrappers over OpenSSL libcrypto: SHA-256 for the audit chain,
 * Ed25519 for manifest signatures, and hex encoding for both.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bastion::util {

constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& data);

// Accepts upper or lower case; nullopt on odd length or a non-hex character
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

struct Ed25519KeyPair {
    std::string public_key_hex;
    std::string private_key_hex;
};

// Throws CryptoError if key generation fails
Ed25519KeyPair generate_ed25519_keypair();

// Public half of a raw private key. Throws CryptoError on a malformed key.
std::string ed25519_public_key_hex(const std::string& private_key_hex);

// Sign message bytes; returns the 64-byte signature as hex.
// Throws CryptoError on a malformed key.
std::string ed25519_sign_hex(const std::string& private_key_hex, const std::string& message);

// True iff signature verifies over the exact message bytes
bool ed25519_verify(const std::vector<uint8_t>& public_key,
                    const std::string& message,
                    const std::vector<uint8_t>& signature);

// Length-checked comparison that does not short-circuit on content
bool constant_time_equals(const std::string& a, const std::string& b);

} // namespace bastion::util
