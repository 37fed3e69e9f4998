#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include "kernel/audit_log.hpp"
#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "kernel/manifest.hpp"
#include "util/crypto.hpp"
#include "util/logger.hpp"

using namespace bastion;

namespace {

constexpr int EXIT_USAGE = 64;
constexpr int EXIT_BROKEN = 2;

void print_usage() {
    fmt::print(fmt::emphasis::bold, "bastion");
    fmt::print(" - agent kernel control-plane tool\n\n");
    fmt::print("Usage:\n");
    fmt::print("  bastion verify-ledger <ledger.jsonl>\n");
    fmt::print("  bastion check-manifest <manifest.toml> [envelope.json]\n");
    fmt::print("  bastion keygen\n");
    fmt::print("  bastion sign <manifest.toml> <private-key-hex> [signer-id]\n");
}

void print_error(const std::string& message) {
    fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold, "error: ");
    fmt::print(stderr, "{}\n", message);
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

int cmd_verify_ledger(const std::string& path) {
    std::unique_ptr<kernel::AuditLedger> ledger;
    try {
        ledger = kernel::AuditLedger::load(path);
    } catch (const kernel::LedgerWriteError& e) {
        print_error(e.what());
        return 1;
    }
    auto result = ledger->verify_chain();
    if (result.intact) {
        fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "OK");
        fmt::print(" {} entries, tip {}\n", result.entries_checked, ledger->tip());
        return 0;
    }
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "BROKEN");
    fmt::print(" at sequence {} ({} entries checked)\n", *result.broken_at, result.entries_checked);
    return EXIT_BROKEN;
}

int cmd_check_manifest(const std::string& manifest_path, const std::string& envelope_path) {
    std::string manifest_toml;
    if (!read_file(manifest_path, manifest_toml)) {
        print_error("cannot read " + manifest_path);
        return 1;
    }

    auto config = kernel::kernel_config_from_env();
    std::optional<kernel::SignedManifestEnvelope> envelope;
    try {
        if (!envelope_path.empty()) {
            std::string envelope_text;
            if (!read_file(envelope_path, envelope_text)) {
                print_error("cannot read " + envelope_path);
                return 1;
            }
            envelope = kernel::SignedManifestEnvelope::from_json_text(envelope_text);
        }

        kernel::ManifestVerifier verifier(config.verifier);
        auto manifest = verifier.verify(manifest_toml, envelope);

        fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "valid");
        fmt::print(" {} v{}{}\n", manifest.name, manifest.version, envelope ? " (signature verified)" : "");
        std::cout << kernel::manifest_to_json(manifest).dump(2) << std::endl;
        return 0;
    } catch (const kernel::ManifestError& e) {
        print_error(e.what());
        return 1;
    }
}

int cmd_keygen() {
    auto keys = util::generate_ed25519_keypair();
    fmt::print("public_key  {}\n", keys.public_key_hex);
    fmt::print("private_key {}\n", keys.private_key_hex);
    return 0;
}

int cmd_sign(const std::string& manifest_path, const std::string& private_key_hex,
             const std::string& signer_id) {
    std::string manifest_toml;
    if (!read_file(manifest_path, manifest_toml)) {
        print_error("cannot read " + manifest_path);
        return 1;
    }
    auto envelope = kernel::sign_manifest(manifest_toml, private_key_hex, signer_id);
    std::cout << envelope.to_json().dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    util::init_logger();
    auto config = kernel::kernel_config_from_env();
    util::set_log_level(util::log_level_from_string(config.log_level));

    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    std::string command = argv[1];
    try {
        if (command == "verify-ledger" && argc == 3) {
            return cmd_verify_ledger(argv[2]);
        }
        if (command == "check-manifest" && (argc == 3 || argc == 4)) {
            return cmd_check_manifest(argv[2], argc == 4 ? argv[3] : "");
        }
        if (command == "keygen" && argc == 2) {
            return cmd_keygen();
        }
        if (command == "sign" && (argc == 4 || argc == 5)) {
            return cmd_sign(argv[2], argv[3], argc == 5 ? argv[4] : "");
        }
    } catch (const util::CryptoError& e) {
        print_error(e.what());
        return 1;
    } catch (const kernel::KernelError& e) {
        print_error(e.what());
        return 1;
    }

    print_usage();
    return EXIT_USAGE;
}
