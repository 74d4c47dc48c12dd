#pragma once

#include "secret_scanner.hpp"
#include "hashing.hpp"
#include "json.hpp"
#include <string>
#include <string_view>
#include <functional>
#include <expected>

namespace ztgate {

// RFC 3339 UTC timestamp with microseconds, e.g. 2026-10-19T08:15:02.123456Z.
std::string utc_timestamp();

struct SignalVotes {
    bool pattern_matched = false;
    bool entropy_over_threshold = false;
    bool variable_name = false;

    int count() const {
        return static_cast<int>(pattern_matched) + static_cast<int>(entropy_over_threshold) +
               static_cast<int>(variable_name);
    }
};

// Local quorum vote over independent signals. A candidate is confirmed when
// at least `quorum` signals agree.
class QuorumValidator {
public:
    QuorumValidator(int quorum, double entropy_threshold);

    int quorum() const { return quorum_; }

    SignalVotes score(const SecretMatch& match, std::string_view content) const;
    bool confirm(const SecretMatch& match, std::string_view content) const {
        return score(match, content).count() >= quorum_;
    }
    MatchList confirmed(const MatchList& candidates, std::string_view content) const;

    // True when the identifier just before `start` (across `=`, `:`, quotes
    // and blanks) names a credential, e.g. `OPENAI_API_KEY=` or `"password": `.
    static bool names_sensitive_variable(std::string_view content, size_t start);

private:
    int quorum_;
    double entropy_threshold_;
};

struct Commitment {
    std::string commitment_id;
    std::string secret_hash;
    std::string secret_type;
    std::string masked_placeholder;
    std::string timestamp;
    json::Object context;

    json::Value to_json() const;
    static Commitment from_json(const json::Value& v);
};

using HashFunction = std::function<std::expected<std::string, HashErrorInfo>(std::string_view)>;

class CommitmentBuilder {
public:
    explicit CommitmentBuilder(HashFunction hash = sha256_hex);

    // `name` identifies where the secret was found, e.g. "embedded_in_command#1".
    std::expected<Commitment, HashErrorInfo> commit(const SecretMatch& match, std::string_view name,
                                                    json::Object context) const;

    // Whether `candidate` is the value `commitment` was made for: its hash is
    // the secret hash and the masked placeholder carries the same prefix.
    std::expected<bool, HashErrorInfo> matches(const Commitment& commitment, std::string_view candidate) const;

    const std::string& process_id() const { return process_id_; }

private:
    HashFunction hash_;
    std::string process_id_;
};

} // namespace ztgate
