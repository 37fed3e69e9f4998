#include "kernel/audit_log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "util/crypto.hpp"
#include "util/sanitize.hpp"

namespace bastion::kernel {

using json = nlohmann::json;

const std::string GENESIS_TIP(64, '0');

const char* audit_action_to_string(AuditAction action) {
    switch (action) {
        case AuditAction::AGENT_SPAWN:        return "AgentSpawn";
        case AuditAction::AGENT_KILL:         return "AgentKill";
        case AuditAction::AGENT_STATE_CHANGE: return "AgentStateChange";
        case AuditAction::TOOL_INVOKE:        return "ToolInvoke";
        case AuditAction::TOOL_RESULT:        return "ToolResult";
        case AuditAction::CAPABILITY_DENIED:  return "CapabilityDenied";
        case AuditAction::QUOTA_EXCEEDED:     return "QuotaExceeded";
        case AuditAction::CONFIG_CHANGE:      return "ConfigChange";
        case AuditAction::TRIGGER_FIRED:      return "TriggerFired";
        case AuditAction::MANIFEST_REJECTED:  return "ManifestRejected";
        default: return "Unknown";
    }
}

std::optional<AuditAction> audit_action_from_string(const std::string& str) {
    if (str == "AgentSpawn")       return AuditAction::AGENT_SPAWN;
    if (str == "AgentKill")        return AuditAction::AGENT_KILL;
    if (str == "AgentStateChange") return AuditAction::AGENT_STATE_CHANGE;
    if (str == "ToolInvoke")       return AuditAction::TOOL_INVOKE;
    if (str == "ToolResult")       return AuditAction::TOOL_RESULT;
    if (str == "CapabilityDenied") return AuditAction::CAPABILITY_DENIED;
    if (str == "QuotaExceeded")    return AuditAction::QUOTA_EXCEEDED;
    if (str == "ConfigChange")     return AuditAction::CONFIG_CHANGE;
    if (str == "TriggerFired")     return AuditAction::TRIGGER_FIRED;
    if (str == "ManifestRejected") return AuditAction::MANIFEST_REJECTED;
    return std::nullopt;
}

// ============================================================================
// AuditEntry
// ============================================================================

std::string AuditEntry::canonical() const {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    json j;
    j["action"] = audit_action_to_string(action);
    j["agent"] = agent;
    j["detail"] = detail;
    j["sequence"] = sequence;
    j["timestamp"] = timestamp;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json AuditEntry::to_json() const {
    json j;
    j["sequence"] = sequence;
    j["timestamp"] = timestamp;
    j["action"] = audit_action_to_string(action);
    j["agent"] = agent;
    j["detail"] = detail;
    j["tip_hash"] = tip_hash;
    return j;
}

std::string AuditEntry::to_jsonl() const {
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

AuditEntry AuditEntry::from_json(const json& j) {
    AuditEntry entry;
    entry.sequence = j.at("sequence").get<uint64_t>();
    entry.timestamp = j.at("timestamp").get<std::string>();

    auto action = audit_action_from_string(j.at("action").get<std::string>());
    if (!action) {
        throw std::invalid_argument("unknown audit action");
    }
    entry.action = *action;
    entry.agent = j.at("agent").get<AgentId>();
    entry.detail = j.at("detail").get<std::string>();
    entry.tip_hash = j.at("tip_hash").get<std::string>();
    return entry;
}

json ChainVerification::to_json() const {
    json j;
    j["intact"] = intact;
    j["broken_at"] = broken_at ? json(*broken_at) : json(nullptr);
    j["entries_checked"] = entries_checked;
    return j;
}

// ============================================================================
// JsonlFileSink
// ============================================================================

struct JsonlFileSink::Stream {
    std::ofstream out;
    uintmax_t committed = 0;   // File size after the last complete write
    bool failed = false;
};

JsonlFileSink::JsonlFileSink(const std::string& path)
    : path_(path), stream_(std::make_unique<Stream>()) {
    open_stream();
}

JsonlFileSink::~JsonlFileSink() = default;

void JsonlFileSink::open_stream() {
    if (stream_->out.is_open()) {
        stream_->out.close();
    }
    stream_->out.clear();
    stream_->out.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!stream_->out) {
        throw LedgerWriteError("cannot open " + path_);
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    stream_->committed = ec ? 0 : size;
}

void JsonlFileSink::recover() {
    if (stream_->out.is_open()) {
        stream_->out.close();
    }
    std::error_code ec;
    if (std::filesystem::exists(path_, ec) &&
        std::filesystem::file_size(path_, ec) != stream_->committed) {
        std::filesystem::resize_file(path_, stream_->committed, ec);
        if (ec) {
            throw LedgerWriteError("cannot truncate " + path_ + ": " + ec.message());
        }
        spdlog::warn("Audit ledger {}: dropped incomplete output after byte {}", path_, stream_->committed);
    }
    open_stream();
    stream_->failed = false;
}

void JsonlFileSink::write_lines(const std::string& lines, uint64_t first_sequence) {
    if (stream_->failed) {
        recover();
    }
    stream_->out << lines;
    stream_->out.flush();
    if (!stream_->out) {
        stream_->failed = true;
        throw LedgerWriteError("cannot write sequence " + std::to_string(first_sequence) +
                               " to " + path_);
    }
    stream_->committed += lines.size();
}

void JsonlFileSink::write(const AuditEntry& entry) {
    write_lines(entry.to_jsonl(), entry.sequence);
}

void JsonlFileSink::write_batch(const std::vector<AuditEntry>& entries) {
    if (entries.empty()) {
        return;
    }
    std::string lines;
    for (const auto& entry : entries) {
        lines += entry.to_jsonl();
    }
    write_lines(lines, entries.front().sequence);
}

// ============================================================================
// AuditCursor
// ============================================================================

AuditCursor::AuditCursor(const AuditLedger& ledger, AuditFilter filter, uint64_t end)
    : ledger_(&ledger), filter_(std::move(filter)), end_(end), pos_(filter_.since_sequence) {}

std::optional<AuditEntry> AuditCursor::next() {
    while (pos_ < end_) {
        if (filter_.limit > 0 && yielded_ >= filter_.limit) {
            return std::nullopt;
        }

        auto entry = ledger_->at(pos_++);
        if (!entry) {
            return std::nullopt;
        }
        if (filter_.action && entry->action != *filter_.action) continue;
        if (filter_.agent && entry->agent != *filter_.agent) continue;

        ++yielded_;
        return entry;
    }
    return std::nullopt;
}

void AuditCursor::reset() {
    pos_ = filter_.since_sequence;
    yielded_ = 0;
}

std::vector<AuditEntry> AuditCursor::collect() {
    std::vector<AuditEntry> result;
    while (auto entry = next()) {
        result.push_back(std::move(*entry));
    }
    return result;
}

// ============================================================================
// AuditLedger
// ============================================================================

AuditLedger::AuditLedger() {
    spdlog::debug("AuditLedger initialized (in-memory)");
}

AuditLedger::AuditLedger(std::unique_ptr<AuditSink> sink)
    : sink_(std::move(sink)) {
    spdlog::debug("AuditLedger initialized with sink");
}

namespace {

struct LedgerFile {
    std::vector<AuditEntry> entries;
    std::optional<uint64_t> corrupt_at;
};

LedgerFile read_ledger_file(const std::string& path) {
    LedgerFile file;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LedgerWriteError("cannot read " + path);
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            file.entries.push_back(AuditEntry::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            file.corrupt_at = file.entries.size();
            spdlog::error("Audit ledger {}: unreadable record at position {}: {}",
                          path, *file.corrupt_at, e.what());
            break;
        } catch (const std::invalid_argument& e) {
            file.corrupt_at = file.entries.size();
            spdlog::error("Audit ledger {}: unreadable record at position {}: {}",
                          path, *file.corrupt_at, e.what());
            break;
        }
    }
    return file;
}

AuditEntry make_entry(uint64_t sequence, const std::string& prev_tip,
                      AuditAction action, AgentId agent, const std::string& detail) {
    AuditEntry entry;
    entry.sequence = sequence;
    entry.timestamp = format_timestamp(std::chrono::system_clock::now());
    entry.action = action;
    entry.agent = agent;
    entry.detail = util::to_valid_utf8(detail);
    entry.tip_hash = util::sha256_hex(prev_tip + entry.canonical());
    return entry;
}

} // anonymous namespace

std::unique_ptr<AuditLedger> AuditLedger::open(const std::string& path) {
    LedgerFile file;
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        file = read_ledger_file(path);
    }

    auto ledger = std::make_unique<AuditLedger>(std::make_unique<JsonlFileSink>(path));
    ledger->entries_ = std::move(file.entries);
    ledger->corrupt_at_ = file.corrupt_at;
    spdlog::info("Audit ledger opened: {} ({} entries)", path, ledger->entries_.size());
    return ledger;
}

std::unique_ptr<AuditLedger> AuditLedger::load(const std::string& path) {
    LedgerFile file = read_ledger_file(path);

    auto ledger = std::make_unique<AuditLedger>();
    ledger->entries_ = std::move(file.entries);
    ledger->corrupt_at_ = file.corrupt_at;
    ledger->read_only_ = true;
    spdlog::debug("Audit ledger loaded read-only: {} ({} entries)", path, ledger->entries_.size());
    return ledger;
}

void AuditLedger::check_writable_locked() const {
    if (read_only_) {
        throw LedgerWriteError("audit ledger is read-only");
    }
    if (corrupt_at_) {
        throw ChainBroken(*corrupt_at_);
    }
}

std::string AuditLedger::tip_locked() const {
    return entries_.empty() ? GENESIS_TIP : entries_.back().tip_hash;
}

AuditEntry AuditLedger::append(AuditAction action, AgentId agent, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_writable_locked();

    AuditEntry entry = make_entry(entries_.size(), tip_locked(), action, agent, detail);

    // Durable first; the in-memory chain only grows once the sink accepted it
    if (sink_) {
        sink_->write(entry);
    }
    entries_.push_back(entry);

    spdlog::trace("Audit[{}] {} agent={} {}", entry.sequence, audit_action_to_string(action),
                  agent, entry.detail);
    return entry;
}

std::vector<AuditEntry> AuditLedger::append_batch(const std::vector<AuditRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_writable_locked();

    std::vector<AuditEntry> batch;
    batch.reserve(records.size());
    std::string prev = tip_locked();
    for (const auto& record : records) {
        batch.push_back(make_entry(entries_.size() + batch.size(), prev,
                                   record.action, record.agent, record.detail));
        prev = batch.back().tip_hash;
    }

    if (sink_ && !batch.empty()) {
        sink_->write_batch(batch);
    }
    entries_.insert(entries_.end(), batch.begin(), batch.end());

    spdlog::trace("Audit batch of {} entries, tip {}", batch.size(), prev.substr(0, 12));
    return batch;
}

void AuditLedger::recover_sink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->recover();
    }
}

ChainVerification AuditLedger::verify_locked() const {
    ChainVerification result;
    std::string prev = GENESIS_TIP;

    for (uint64_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        ++result.entries_checked;

        if (entry.sequence != i || util::sha256_hex(prev + entry.canonical()) != entry.tip_hash) {
            result.intact = false;
            result.broken_at = i;
            return result;
        }
        prev = entry.tip_hash;
    }

    if (corrupt_at_) {
        result.intact = false;
        result.broken_at = *corrupt_at_;
    }
    return result;
}

ChainVerification AuditLedger::verify_chain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = verify_locked();
    if (!result.intact) {
        spdlog::error("Audit chain broken at sequence {}", *result.broken_at);
    }
    return result;
}

void AuditLedger::require_intact() const {
    auto result = verify_chain();
    if (!result.intact) {
        throw ChainBroken(*result.broken_at);
    }
}

AuditCursor AuditLedger::query(const AuditFilter& filter) const {
    return AuditCursor(*this, filter, size());
}

std::optional<AuditEntry> AuditLedger::at(uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence >= entries_.size()) {
        return std::nullopt;
    }
    return entries_[sequence];
}

std::string AuditLedger::export_jsonl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& entry : entries_) {
        oss << entry.to_jsonl();
    }
    return oss.str();
}

std::string AuditLedger::tip() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tip_locked();
}

size_t AuditLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace bastion::kernel
