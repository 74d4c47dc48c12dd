#include "audit_chain.hpp"
#include "hashing.hpp"
#include "log.hpp"
#include <algorithm>
#include <mutex>
#include <fmt/format.h>

namespace ztgate {

namespace {

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string::npos) {
            out.push_back(content.substr(pos));
            break;
        }
        out.push_back(content.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return out;
}

json::Array string_array(const std::vector<std::string>& v) {
    json::Array a;
    a.reserve(v.size());
    for (const auto& s : v) a.emplace_back(s);
    return a;
}

IntegrityReport violation(uint64_t sequence, uint64_t checked, std::string detail) {
    IntegrityReport r;
    r.ok = false;
    r.first_violation = sequence;
    r.entries_checked = checked;
    r.detail = std::move(detail);
    return r;
}

} // namespace

std::string_view to_string(Decision d) {
    return d == Decision::Allow ? "ALLOW" : "BLOCK";
}

json::Object AuditEntry::body() const {
    json::Array ids;
    json::Array types;
    json::Array full;
    for (const auto& c : commitments) {
        ids.emplace_back(c.commitment_id);
        types.emplace_back(c.secret_type);
        full.push_back(c.to_json());
    }

    json::Object o;
    o["timestamp"] = timestamp;
    o["sequenceNumber"] = sequence_number;
    o["commitmentId"] = std::move(ids);
    o["secretType"] = std::move(types);
    o["commitments"] = std::move(full);
    o["decision"] = to_string(decision);
    o["reason"] = reason;
    o["toolName"] = tool_name;
    o["flags"] = string_array(flags);
    o["previousEntryHash"] = previous_entry_hash;
    return o;
}

json::Value AuditEntry::to_json() const {
    json::Object o = body();
    o["entryHash"] = entry_hash;
    return o;
}

std::expected<AuditEntry, AuditErrorInfo> parse_entry(const json::Value& v) {
    if (!v.is_object()) {
        return std::unexpected(AuditErrorInfo{AuditError::CorruptChain, "audit entry is not a JSON object"});
    }
    double seq = v.get_number("sequenceNumber", -1);
    if (seq < 1) {
        return std::unexpected(AuditErrorInfo{AuditError::CorruptChain, "audit entry has no sequence number"});
    }
    std::string decision = v.get_string("decision");
    if (decision != "ALLOW" && decision != "BLOCK") {
        return std::unexpected(AuditErrorInfo{AuditError::CorruptChain,
                                              fmt::format("audit entry {} has decision '{}'", seq, decision)});
    }

    AuditEntry e;
    e.sequence_number = static_cast<uint64_t>(seq);
    e.timestamp = v.get_string("timestamp");
    e.decision = decision == "ALLOW" ? Decision::Allow : Decision::Block;
    e.reason = v.get_string("reason");
    e.tool_name = v.get_string("toolName");
    e.previous_entry_hash = v.get_string("previousEntryHash");
    e.entry_hash = v.get_string("entryHash");
    if (v["commitments"].is_array()) {
        for (const auto& c : v["commitments"].as_array()) e.commitments.push_back(Commitment::from_json(c));
    }
    if (v["flags"].is_array()) {
        for (const auto& f : v["flags"].as_array()) {
            if (f.is_string()) e.flags.push_back(f.as_string());
        }
    }
    return e;
}

AuditChain::AuditChain()
    : open_(true), last_hash_(kGenesisHash) {}

AuditChain::AuditChain(std::filesystem::path path)
    : file_(AuditLogFile(std::move(path))), last_hash_(kGenesisHash) {}

std::expected<std::string, HashErrorInfo> AuditChain::link_hash(std::string_view previous_hash,
                                                                const json::Object& body) {
    Sha256 h;
    h.update(previous_hash).update(json::dump(body));
    return h.finish_hex();
}

std::expected<void, AuditErrorInfo> AuditChain::load_tail_locked() {
    auto tail = file_->last_line();
    if (!tail) {
        return std::unexpected(AuditErrorInfo{AuditError::ReadFailed, tail.error().message});
    }
    if (!*tail) {
        last_sequence_ = 0;
        last_hash_ = std::string(kGenesisHash);
        return {};
    }

    auto v = json::parse(**tail);
    if (!v || !v->is_object()) {
        return std::unexpected(AuditErrorInfo{
            AuditError::CorruptChain, fmt::format("last entry of {} is not valid JSON", file_->path().string())});
    }
    double n = v->get_number("sequenceNumber", -1);
    std::string hash = v->get_string("entryHash");
    if (n < 1 || hash.size() != kSha256HexLength) {
        return std::unexpected(AuditErrorInfo{
            AuditError::CorruptChain,
            fmt::format("last entry of {} has no sequence number or entry hash", file_->path().string())});
    }
    last_sequence_ = static_cast<uint64_t>(n);
    last_hash_ = std::move(hash);
    return {};
}

std::expected<void, AuditErrorInfo> AuditChain::open() {
    std::unique_lock lock(mutex_);
    if (open_) return {};
    if (!file_) {
        open_ = true;
        return {};
    }

    if (auto r = file_->open(); !r) {
        return std::unexpected(AuditErrorInfo{AuditError::OpenFailed, r.error().message});
    }
    auto shared = file_->lock(LockMode::Shared);
    if (!shared) {
        file_->close();
        return std::unexpected(AuditErrorInfo{AuditError::OpenFailed, shared.error().message});
    }
    auto tail = load_tail_locked();
    shared->release();
    if (!tail) {
        file_->close();
        return std::unexpected(tail.error());
    }

    open_ = true;
    Log::debug("audit chain {} opened at sequence {}", file_->path().string(), last_sequence_);
    return {};
}

void AuditChain::close() {
    std::unique_lock lock(mutex_);
    if (file_) file_->close();
    open_ = false;
}

bool AuditChain::is_open() const {
    std::shared_lock lock(mutex_);
    return open_;
}

uint64_t AuditChain::last_sequence() const {
    std::shared_lock lock(mutex_);
    return last_sequence_;
}

std::string AuditChain::last_hash() const {
    std::shared_lock lock(mutex_);
    return last_hash_;
}

std::expected<AuditEntry, AuditErrorInfo> AuditChain::append(AuditRecord record) {
    std::unique_lock lock(mutex_);
    if (!open_) {
        return std::unexpected(AuditErrorInfo{AuditError::NotOpen, "audit chain is not open"});
    }

    std::optional<FileLock> exclusive;
    if (file_) {
        auto acquired = file_->lock(LockMode::Exclusive);
        if (!acquired) {
            return std::unexpected(AuditErrorInfo{
                AuditError::AppendFailed,
                fmt::format("cannot lock {}: {}", file_->path().string(), acquired.error().message)});
        }
        exclusive = std::move(*acquired);
        // Another process may have appended since this chain was opened.
        if (auto r = load_tail_locked(); !r) return std::unexpected(r.error());
    }

    AuditEntry e;
    e.sequence_number = last_sequence_ + 1;
    e.timestamp = utc_timestamp();
    e.commitments = std::move(record.commitments);
    e.decision = record.decision;
    e.reason = std::move(record.reason);
    e.tool_name = std::move(record.tool_name);
    e.flags = std::move(record.flags);
    e.previous_entry_hash = last_hash_;

    auto hash = link_hash(e.previous_entry_hash, e.body());
    if (!hash) {
        return std::unexpected(AuditErrorInfo{AuditError::HashFailed, hash.error().message});
    }
    e.entry_hash = std::move(*hash);

    std::string line = json::dump(e.to_json());
    if (file_) {
        if (auto r = file_->append_line(line); !r) {
            return std::unexpected(AuditErrorInfo{
                AuditError::AppendFailed,
                fmt::format("cannot persist entry {} to {}: {}", e.sequence_number, file_->path().string(),
                            r.error().message)});
        }
    } else {
        memory_lines_.push_back(std::move(line));
    }

    last_sequence_ = e.sequence_number;
    last_hash_ = e.entry_hash;
    return e;
}

std::expected<std::vector<std::string>, AuditErrorInfo> AuditChain::read_lines_locked() const {
    if (!file_) return memory_lines_;
    auto content = AuditLogFile::read_all(file_->path());
    if (!content) {
        return std::unexpected(AuditErrorInfo{AuditError::ReadFailed, content.error().message});
    }
    return split_lines(*content);
}

std::expected<std::vector<std::string>, AuditErrorInfo> AuditChain::lines() const {
    std::shared_lock lock(mutex_);
    return read_lines_locked();
}

std::expected<std::vector<AuditEntry>, AuditErrorInfo> AuditChain::entries(std::optional<size_t> limit) const {
    std::shared_lock lock(mutex_);
    auto current = read_lines_locked();
    if (!current) return std::unexpected(current.error());

    size_t first = 0;
    if (limit && *limit < current->size()) first = current->size() - *limit;

    std::vector<AuditEntry> out;
    out.reserve(current->size() - first);
    for (size_t i = first; i < current->size(); ++i) {
        auto v = json::parse((*current)[i]);
        if (!v) {
            Log::warn("skipping audit line {}: {}", i + 1, v.error().message);
            continue;
        }
        auto e = parse_entry(*v);
        if (!e) {
            Log::warn("skipping audit line {}: {}", i + 1, e.error().message);
            continue;
        }
        out.push_back(std::move(*e));
    }
    return out;
}

std::expected<ChainStats, AuditErrorInfo> AuditChain::stats() const {
    std::shared_lock lock(mutex_);
    auto current = read_lines_locked();
    if (!current) return std::unexpected(current.error());

    ChainStats s;
    for (const auto& line : *current) {
        auto v = json::parse(line);
        if (!v) continue;
        auto e = parse_entry(*v);
        if (!e) continue;
        ++s.total_entries;
        if (e->decision == Decision::Allow) ++s.allowed;
        else ++s.blocked;
        s.commitments += e->commitments.size();
        if (std::find(e->flags.begin(), e->flags.end(), kTruncatedScanFlag) != e->flags.end()) ++s.truncated_scans;
        if (!e->timestamp.empty()) {
            // RFC 3339 UTC timestamps of equal width order lexicographically.
            if (s.earliest_timestamp.empty() || e->timestamp < s.earliest_timestamp) s.earliest_timestamp = e->timestamp;
            if (e->timestamp > s.latest_timestamp) s.latest_timestamp = e->timestamp;
        }
    }
    s.integrity = verify_lines(*current);
    return s;
}

IntegrityReport AuditChain::verify_integrity() const {
    std::shared_lock lock(mutex_);
    auto current = read_lines_locked();
    if (!current) {
        IntegrityReport r;
        r.ok = false;
        r.detail = current.error().message;
        return r;
    }
    return verify_lines(*current);
}

IntegrityReport AuditChain::verify_lines(const std::vector<std::string>& lines) {
    IntegrityReport report;
    std::string prev(kGenesisHash);

    for (size_t i = 0; i < lines.size(); ++i) {
        uint64_t expected = i + 1;
        auto v = json::parse(lines[i]);
        if (!v || !v->is_object()) {
            return violation(expected, report.entries_checked, fmt::format("entry {} is not valid JSON", expected));
        }

        json::Object body = v->as_object();
        double seq = v->get_number("sequenceNumber", -1);
        if (seq != static_cast<double>(expected)) {
            return violation(expected, report.entries_checked,
                             fmt::format("entry {} has sequence number {}", expected, seq));
        }
        if (v->get_string("previousEntryHash") != prev) {
            return violation(expected, report.entries_checked,
                             fmt::format("entry {} does not link to the previous entry hash", expected));
        }

        std::string stored = v->get_string("entryHash");
        body.erase("entryHash");
        auto recomputed = link_hash(prev, body);
        if (!recomputed) {
            return violation(expected, report.entries_checked,
                             fmt::format("entry {} could not be hashed: {}", expected, recomputed.error().message));
        }
        if (*recomputed != stored) {
            return violation(expected, report.entries_checked,
                             fmt::format("entry {} hash mismatch", expected));
        }

        prev = std::move(stored);
        ++report.entries_checked;
    }
    report.detail = fmt::format("{} entries verified", report.entries_checked);
    return report;
}

} // namespace ztgate
