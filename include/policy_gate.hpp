#pragma once

#include "audit_chain.hpp"
#include "commitment.hpp"
#include "config.hpp"
#include "json.hpp"
#include "secret_scanner.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ztgate {

struct ToolInvocation {
    std::string tool_name;
    json::Value tool_input;
};

struct GateDecision {
    Decision decision = Decision::Block;
    // Input with every confirmed secret replaced by a placeholder; same shape as the original.
    std::optional<json::Value> sanitized_input;
    std::string reason;
    std::optional<uint64_t> audit_entry_id;
    std::vector<std::string> secret_types;
    std::vector<std::string> commitment_ids;
    bool truncated_scan = false;
    std::vector<std::string> warnings;

    bool allowed() const { return decision == Decision::Allow; }
};

// detect -> confirm -> redact -> commit -> audit -> decide, once per tool call.
// process() may be called concurrently; the shared chain serializes appends.
class PolicyGate {
public:
    PolicyGate(GateConfig config, AuditChain& chain);
    PolicyGate(GateConfig config, AuditChain& chain, CommitmentBuilder commitments);

    GateDecision process(const ToolInvocation& call) const;

    const GateConfig& config() const { return config_; }
    const DetectorRegistry& registry() const { return registry_; }

    // Matches for one string, honoring the scan ceiling. `truncated` is set
    // when the middle of the string was skipped.
    MatchList scan_text(std::string_view text, bool& truncated) const;

private:
    struct CallState;

    GateConfig config_;
    AuditChain& chain_;
    DetectorRegistry registry_;
    QuorumValidator validator_;
    CommitmentBuilder commitments_;

    void scan_value(json::Value& value, const std::string& path, CallState& state) const;
    void scan_field(json::Value& value, const std::string& path, CallState& state) const;
    void record(GateDecision& result, AuditRecord record) const;
};

} // namespace ztgate
