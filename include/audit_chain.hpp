#pragma once

#include "audit_log_file.hpp"
#include "commitment.hpp"
#include "json.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ztgate {

enum class Decision {
    Allow,
    Block
};

std::string_view to_string(Decision d);

inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";
inline constexpr std::string_view kTruncatedScanFlag = "truncated_scan";

// What the gate asks to be recorded. The chain fills in sequence, time and hashes.
struct AuditRecord {
    std::vector<Commitment> commitments;
    Decision decision = Decision::Block;
    std::string reason;
    std::string tool_name;
    std::vector<std::string> flags;
};

struct AuditEntry {
    uint64_t sequence_number = 0;
    std::string timestamp;
    std::vector<Commitment> commitments;
    Decision decision = Decision::Block;
    std::string reason;
    std::string tool_name;
    std::vector<std::string> flags;
    std::string previous_entry_hash;
    std::string entry_hash;

    // Every field except entryHash; its dump() is the hash preimage.
    json::Object body() const;
    json::Value to_json() const;
};

enum class AuditError {
    NotOpen,
    OpenFailed,
    ReadFailed,
    CorruptChain,
    AppendFailed,
    HashFailed
};

struct AuditErrorInfo {
    AuditError error;
    std::string message;
};

// Parses one serialized entry. Hashes are taken as stored, not checked.
std::expected<AuditEntry, AuditErrorInfo> parse_entry(const json::Value& v);

struct IntegrityReport {
    bool ok = true;
    std::optional<uint64_t> first_violation;
    uint64_t entries_checked = 0;
    std::string detail;
};

struct ChainStats {
    uint64_t total_entries = 0;
    uint64_t allowed = 0;
    uint64_t blocked = 0;
    uint64_t commitments = 0;
    uint64_t truncated_scans = 0;
    std::string earliest_timestamp;
    std::string latest_timestamp;
    IntegrityReport integrity;
};

// Hash-linked, append-only decision log. Either file-backed (JSON lines,
// flushed per entry) or in-memory. Appends are serialized; verification reads
// a consistent snapshot. For a file the serialization extends across
// processes: each append holds an exclusive flock and continues from the
// entry actually on disk.
class AuditChain {
public:
    // In-memory chain, usable immediately.
    AuditChain();
    // File-backed chain; call open() before appending.
    explicit AuditChain(std::filesystem::path path);

    AuditChain(const AuditChain&) = delete;
    AuditChain& operator=(const AuditChain&) = delete;

    // Recovers the last sequence number and hash from an existing log.
    std::expected<void, AuditErrorInfo> open();
    void close();

    bool is_open() const;
    bool persistent() const { return file_.has_value(); }

    std::expected<AuditEntry, AuditErrorInfo> append(AuditRecord record);

    IntegrityReport verify_integrity() const;

    // Serialized entries, oldest first.
    std::expected<std::vector<std::string>, AuditErrorInfo> lines() const;

    // The newest `limit` entries (all when unset), oldest first. Lines that do
    // not parse are skipped; verify_integrity() reports them.
    std::expected<std::vector<AuditEntry>, AuditErrorInfo> entries(std::optional<size_t> limit = std::nullopt) const;

    // Counts and time span over one snapshot of the log, with its integrity report.
    std::expected<ChainStats, AuditErrorInfo> stats() const;

    uint64_t last_sequence() const;
    std::string last_hash() const;

    // Replays `lines` from the genesis hash and stops at the first divergence.
    static IntegrityReport verify_lines(const std::vector<std::string>& lines);

    // Hash of `body` linked after `previous_hash`.
    static std::expected<std::string, HashErrorInfo> link_hash(std::string_view previous_hash,
                                                               const json::Object& body);

private:
    mutable std::shared_mutex mutex_;
    std::optional<AuditLogFile> file_;
    std::vector<std::string> memory_lines_;
    bool open_ = false;
    uint64_t last_sequence_ = 0;
    std::string last_hash_;

    std::expected<std::vector<std::string>, AuditErrorInfo> read_lines_locked() const;
    std::expected<void, AuditErrorInfo> load_tail_locked();
};

} // namespace ztgate
