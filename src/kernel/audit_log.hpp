/**
 * Bastion Audit Ledger
 *
 * Append-only, hash-chained record of every security-relevant action.
 * Each entry's tip_hash is SHA-256 over the previous tip (hex) followed by
 * the entry's canonical serialization, so recomputing the chain from
 * sequence 0 detects any altered, inserted or dropped entry.
 *
 * The ledger never redacts; callers pass already-sanitized detail text.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "kernel/types.hpp"

namespace bastion::kernel {

enum class AuditAction {
    AGENT_SPAWN,
    AGENT_KILL,
    AGENT_STATE_CHANGE,
    TOOL_INVOKE,
    TOOL_RESULT,
    CAPABILITY_DENIED,
    QUOTA_EXCEEDED,
    CONFIG_CHANGE,
    TRIGGER_FIRED,
    MANIFEST_REJECTED
};

const char* audit_action_to_string(AuditAction action);
std::optional<AuditAction> audit_action_from_string(const std::string& str);

// Predecessor of the first entry
extern const std::string GENESIS_TIP;

struct AuditEntry {
    uint64_t sequence = 0;
    std::string timestamp;      // ISO 8601 UTC
    AuditAction action = AuditAction::CONFIG_CHANGE;
    AgentId agent = KERNEL_AGENT_ID;
    std::string detail;
    std::string tip_hash;

    // Compact, key-sorted JSON of every field except tip_hash
    std::string canonical() const;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;

    // Throws std::invalid_argument or nlohmann::json::exception on a malformed record
    static AuditEntry from_json(const nlohmann::json& j);
};

struct AuditFilter {
    std::optional<AuditAction> action;
    std::optional<AgentId> agent;
    uint64_t since_sequence = 0;   // Inclusive
    size_t limit = 0;              // 0 = no limit
};

struct ChainVerification {
    bool intact = true;
    std::optional<uint64_t> broken_at;
    uint64_t entries_checked = 0;

    nlohmann::json to_json() const;
};

// One entry for AuditLedger::append_batch
struct AuditRecord {
    AuditAction action = AuditAction::CONFIG_CHANGE;
    AgentId agent = KERNEL_AGENT_ID;
    std::string detail;
};

// Destination for appended entries. write() must make the entry durable
// before returning, or throw.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void write(const AuditEntry& entry) = 0;

    // Several entries as one unit. The default writes them one at a time,
    // so a failure part-way may leave the first ones behind.
    virtual void write_batch(const std::vector<AuditEntry>& entries) {
        for (const auto& entry : entries) {
            write(entry);
        }
    }

    // Reset after a failed write. Throws LedgerWriteError if the
    // destination is still unusable.
    virtual void recover() {}
};

// One JSON record per line, flushed per write. A batch is a single write.
// After a failure the file is cut back to the last complete write before
// anything else is appended.
class JsonlFileSink : public AuditSink {
public:
    explicit JsonlFileSink(const std::string& path);
    ~JsonlFileSink() override;

    void write(const AuditEntry& entry) override;
    void write_batch(const std::vector<AuditEntry>& entries) override;

    // Truncate to the last complete write and reopen the file
    void recover() override;

private:
    std::string path_;
    struct Stream;
    std::unique_ptr<Stream> stream_;

    void open_stream();
    void write_lines(const std::string& lines, uint64_t first_sequence);
};

class AuditLedger;

// Restartable iteration over a fixed range of the ledger. Entries appended
// after the cursor was created are not visited. Must not outlive its ledger.
class AuditCursor {
public:
    std::optional<AuditEntry> next();
    void reset();

    // Drain what remains
    std::vector<AuditEntry> collect();

private:
    friend class AuditLedger;
    AuditCursor(const AuditLedger& ledger, AuditFilter filter, uint64_t end);

    const AuditLedger* ledger_;
    AuditFilter filter_;
    uint64_t end_;
    uint64_t pos_;
    size_t yielded_ = 0;
};

class AuditLedger {
public:
    AuditLedger();
    explicit AuditLedger(std::unique_ptr<AuditSink> sink);

    // Reload a JSONL ledger (if the file exists) and keep appending to it.
    // A line that does not parse marks the chain broken at that position.
    static std::unique_ptr<AuditLedger> open(const std::string& path);

    // Read a JSONL ledger without opening it for writing. Appends throw
    // LedgerWriteError. Throws LedgerWriteError if the file cannot be read.
    static std::unique_ptr<AuditLedger> load(const std::string& path);

    // Single point of mutation. Throws LedgerWriteError if the sink fails
    // (the chain is not extended) and ChainBroken if a reloaded file was corrupt.
    AuditEntry append(AuditAction action, AgentId agent, const std::string& detail);

    // Consecutive entries written to the sink as one unit: either all of
    // them join the chain or none do. Same errors as append().
    std::vector<AuditEntry> append_batch(const std::vector<AuditRecord>& records);

    // Let the sink recover from a failed write (AuditSink::recover)
    void recover_sink();

    // Recompute every tip_hash from sequence 0
    ChainVerification verify_chain() const;

    // Throws ChainBroken at the first bad sequence
    void require_intact() const;

    AuditCursor query(const AuditFilter& filter = {}) const;

    std::optional<AuditEntry> at(uint64_t sequence) const;
    std::string export_jsonl() const;

    std::string tip() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditEntry> entries_;
    std::unique_ptr<AuditSink> sink_;
    std::optional<uint64_t> corrupt_at_;  // First unreadable line of a reloaded file
    bool read_only_ = false;

    ChainVerification verify_locked() const;
    void check_writable_locked() const;
    std::string tip_locked() const;
};

} // namespace bastion::kernel
