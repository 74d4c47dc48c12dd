#include "policy_gate.hpp"
#include "log.hpp"
#include "redactor.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace ztgate {

struct PolicyGate::CallState {
    std::string tool_name;
    size_t next_sequence = 1;
    Mapping mapping;
    std::vector<Commitment> commitments;
    std::vector<std::string> secret_types;
    bool truncated = false;
    std::optional<std::string> hash_failure;
    std::optional<std::string> internal_error;

    bool stopped() const { return hash_failure.has_value() || internal_error.has_value(); }
};

namespace {

void add_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

std::string describe(const std::vector<std::string>& types, const std::vector<std::string>& ids) {
    return fmt::format("{} (commitment {})", fmt::join(types, ", "), fmt::join(ids, ", "));
}

// The registry reports nothing for content with NUL bytes, so such text is
// scanned one NUL-free segment at a time. Offsets are shifted by `base`.
void detect_segments(const DetectorRegistry& registry, std::string_view text, size_t base, MatchList& out) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nul = text.find('\0', pos);
        size_t end = nul == std::string_view::npos ? text.size() : nul;
        if (end > pos) {
            for (auto m : registry.detect(text.substr(pos, end - pos))) {
                m.start += base + pos;
                m.end += base + pos;
                out.push_back(std::move(m));
            }
        }
        if (nul == std::string_view::npos) break;
        pos = nul + 1;
    }
}

} // namespace

PolicyGate::PolicyGate(GateConfig config, AuditChain& chain)
    : PolicyGate(std::move(config), chain, CommitmentBuilder{}) {}

PolicyGate::PolicyGate(GateConfig config, AuditChain& chain, CommitmentBuilder commitments)
    : config_(std::move(config)), chain_(chain), registry_(DetectorRegistry::from_config(config_)),
      validator_(config_.quorum, config_.entropy_threshold), commitments_(std::move(commitments)) {}

MatchList PolicyGate::scan_text(std::string_view text, bool& truncated) const {
    size_t head = config_.max_scan_bytes;
    size_t tail = config_.tail_window_bytes;
    MatchList matches;
    if (text.size() <= head + tail) {
        detect_segments(registry_, text, 0, matches);
        return matches;
    }

    truncated = true;
    detect_segments(registry_, text.substr(0, head), 0, matches);
    size_t tail_start = text.size() - tail;
    detect_segments(registry_, text.substr(tail_start), tail_start, matches);
    return matches;
}

void PolicyGate::scan_field(json::Value& value, const std::string& path, CallState& state) const {
    const std::string& text = value.as_string();
    bool truncated = false;
    MatchList confirmed = validator_.confirmed(scan_text(text, truncated), text);
    if (truncated) {
        state.truncated = true;
        Log::info("{}: scanned {} of {} bytes", path, config_.max_scan_bytes + config_.tail_window_bytes,
                  text.size());
    }
    if (confirmed.empty()) return;

    auto redacted = redact(text, confirmed, state.next_sequence);
    if (!redacted) {
        state.internal_error = fmt::format("redaction of {} failed: {}", path, redacted.error().message);
        return;
    }

    // redact() numbers matches in start order, which is the order of `confirmed`.
    for (size_t i = 0; i < confirmed.size(); ++i) {
        const auto& m = confirmed[i];
        json::Object context;
        context["toolName"] = state.tool_name;
        context["parameter"] = path;
        auto c = commitments_.commit(m, fmt::format("embedded_in_{}#{}", path, state.next_sequence + i),
                                     std::move(context));
        if (!c) {
            state.hash_failure = c.error().message;
            return;
        }
        add_unique(state.secret_types, m.type);
        state.commitments.push_back(std::move(*c));
    }

    state.next_sequence += confirmed.size();
    value = json::Value(std::move(redacted->sanitized));
    state.mapping.append(std::move(redacted->mapping));
}

void PolicyGate::scan_value(json::Value& value, const std::string& path, CallState& state) const {
    if (state.stopped()) return;
    if (value.is_string()) {
        scan_field(value, path, state);
    } else if (value.is_array()) {
        auto& arr = value.as_array();
        for (size_t i = 0; i < arr.size() && !state.stopped(); ++i) {
            scan_value(arr[i], fmt::format("{}[{}]", path, i), state);
        }
    } else if (value.is_object()) {
        for (auto& [key, member] : value.as_object()) {
            if (state.stopped()) break;
            scan_value(member, path.empty() ? key : fmt::format("{}.{}", path, key), state);
        }
    }
}

void PolicyGate::record(GateDecision& result, AuditRecord record) const {
    auto entry = chain_.append(std::move(record));
    if (entry) {
        result.audit_entry_id = entry->sequence_number;
        return;
    }

    std::string warning = fmt::format("audit entry not persisted: {}", entry.error().message);
    Log::warn("{}", warning);
    result.warnings.push_back(warning);
    if (config_.security_level == SecurityLevel::FailSecure && result.decision == Decision::Allow) {
        result.decision = Decision::Block;
        result.sanitized_input.reset();
        result.reason = fmt::format("blocked: audit log unavailable ({})", entry.error().message);
    }
}

GateDecision PolicyGate::process(const ToolInvocation& call) const {
    GateDecision result;
    if (!config_.enabled) {
        result.decision = Decision::Allow;
        result.sanitized_input = call.tool_input;
        result.reason = "gate disabled";
        return result;
    }

    CallState state;
    state.tool_name = call.tool_name;
    json::Value sanitized = call.tool_input;
    scan_value(sanitized, sanitized.is_string() ? "input" : "", state);

    result.truncated_scan = state.truncated;
    std::vector<std::string> flags;
    if (state.truncated) {
        flags.emplace_back(kTruncatedScanFlag);
        result.warnings.push_back("input exceeded the scan ceiling; only head and tail were scanned");
    }

    if (state.hash_failure) {
        // No commitment can be produced, so nothing about the secret may pass.
        Log::error("hashing failed for {}: {}", call.tool_name, *state.hash_failure);
        result.decision = Decision::Block;
        result.reason = fmt::format("blocked: secret commitment failed ({})", *state.hash_failure);
        result.secret_types = state.secret_types;
        record(result, AuditRecord{{}, Decision::Block, result.reason, call.tool_name, flags});
        return result;
    }

    if (state.internal_error) {
        result.warnings.push_back(*state.internal_error);
        if (config_.security_level == SecurityLevel::FailSafe) {
            Log::warn("{}; allowing unmodified input (FAIL_SAFE)", *state.internal_error);
            result.decision = Decision::Allow;
            result.sanitized_input = call.tool_input;
            result.reason = fmt::format("allowed after internal error: {}", *state.internal_error);
            return result;
        }
        Log::error("{}; blocking (FAIL_SECURE)", *state.internal_error);
        result.decision = Decision::Block;
        result.reason = fmt::format("blocked after internal error: {}", *state.internal_error);
        record(result, AuditRecord{std::move(state.commitments), Decision::Block, result.reason, call.tool_name,
                                   flags});
        return result;
    }

    for (const auto& c : state.commitments) result.commitment_ids.push_back(c.commitment_id);
    result.secret_types = state.secret_types;

    if (state.commitments.empty()) {
        result.decision = Decision::Allow;
        result.sanitized_input = std::move(sanitized);
        result.reason = "no secrets detected";
        // A partial scan is recorded even when clean calls are not.
        if (config_.audit_allow || state.truncated) {
            record(result, AuditRecord{{}, Decision::Allow, result.reason, call.tool_name, flags});
        }
        return result;
    }

    std::string found = describe(result.secret_types, result.commitment_ids);
    result.sanitized_input = std::move(sanitized);
    if (config_.on_detection == DetectionAction::Block) {
        result.decision = Decision::Block;
        result.reason = fmt::format("blocked {}: detected {}", call.tool_name, found);
    } else {
        result.decision = Decision::Allow;
        result.reason = fmt::format("redacted {} secret(s): {}", state.commitments.size(), found);
    }
    Log::info("{}", result.reason);

    record(result, AuditRecord{std::move(state.commitments), result.decision, result.reason, call.tool_name,
                               std::move(flags)});
    return result;
}

} // namespace ztgate
