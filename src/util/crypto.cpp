#include "util/crypto.hpp"
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace bastion::util {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[i * 2]     = kHexChars[data[i] >> 4];
        out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw CryptoError("SHA-256 digest failed");
    }
    return to_hex(digest, len);
}

Ed25519KeyPair generate_ed25519_keypair() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw CryptoError("Ed25519 keygen init failed");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw CryptoError("Ed25519 keygen failed");
    }
    PkeyPtr pkey(raw, EVP_PKEY_free);

    uint8_t pub[ED25519_PUBLIC_KEY_SIZE];
    uint8_t priv[ED25519_PRIVATE_KEY_SIZE];
    size_t pub_len = sizeof(pub);
    size_t priv_len = sizeof(priv);
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pub, &pub_len) != 1 ||
        EVP_PKEY_get_raw_private_key(pkey.get(), priv, &priv_len) != 1) {
        throw CryptoError("Ed25519 key export failed");
    }

    Ed25519KeyPair pair;
    pair.public_key_hex = to_hex(pub, pub_len);
    pair.private_key_hex = to_hex(priv, priv_len);
    OPENSSL_cleanse(priv, sizeof(priv));
    return pair;
}

namespace {

PkeyPtr load_private_key(const std::string& private_key_hex) {
    auto key = from_hex(private_key_hex);
    if (!key || key->size() != ED25519_PRIVATE_KEY_SIZE) {
        throw CryptoError("Ed25519 private key must be 32 bytes of hex");
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, key->data(), key->size()),
                 EVP_PKEY_free);
    OPENSSL_cleanse(key->data(), key->size());
    if (!pkey) {
        throw CryptoError("invalid Ed25519 private key");
    }
    return pkey;
}

} // namespace

std::string ed25519_public_key_hex(const std::string& private_key_hex) {
    PkeyPtr pkey = load_private_key(private_key_hex);

    uint8_t pub[ED25519_PUBLIC_KEY_SIZE];
    size_t pub_len = sizeof(pub);
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pub, &pub_len) != 1) {
        throw CryptoError("Ed25519 public key export failed");
    }
    return to_hex(pub, pub_len);
}

std::string ed25519_sign_hex(const std::string& private_key_hex, const std::string& message) {
    PkeyPtr pkey = load_private_key(private_key_hex);

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        throw CryptoError("Ed25519 sign init failed");
    }

    uint8_t signature[ED25519_SIGNATURE_SIZE];
    size_t sig_len = sizeof(signature);
    if (EVP_DigestSign(ctx.get(), signature, &sig_len,
                       reinterpret_cast<const unsigned char*>(message.data()),
                       message.size()) != 1) {
        throw CryptoError("Ed25519 signing failed");
    }
    return to_hex(signature, sig_len);
}

bool ed25519_verify(const std::vector<uint8_t>& public_key,
                    const std::string& message,
                    const std::vector<uint8_t>& signature) {
    if (public_key.size() != ED25519_PUBLIC_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             public_key.data(), public_key.size()),
                 EVP_PKEY_free);
    if (!pkey) {
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }

    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace bastion::util
