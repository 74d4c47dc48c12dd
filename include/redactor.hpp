#pragma once

#include "secret_scanner.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace ztgate {

struct Placeholder {
    std::string token;
    std::string secret_type;
    size_t sequence_id = 0;
};

// Ordered placeholder -> raw value table for one gate call. Move-only; raw
// values are wiped when the mapping is destroyed or cleared.
class Mapping {
public:
    struct Entry {
        Placeholder placeholder;
        std::string raw_value;
    };

    Mapping() = default;
    ~Mapping();

    Mapping(const Mapping&) = delete;
    Mapping& operator=(const Mapping&) = delete;
    Mapping(Mapping&&) noexcept = default;
    Mapping& operator=(Mapping&& other) noexcept;

    void add(Placeholder placeholder, std::string raw_value);
    void append(Mapping&& other);
    void clear();

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const std::vector<Entry>& entries() const { return entries_; }

    // Raw value for a token, nullptr if the token is not in the mapping.
    const std::string* find(std::string_view token) const;

private:
    std::vector<Entry> entries_;
};

struct RedactionResult {
    std::string sanitized;
    Mapping mapping;
};

enum class RedactError {
    OutOfRange,
    OverlappingMatches
};

struct RedactErrorInfo {
    RedactError error;
    std::string message;
};

// Placeholder text for a secret type: upper case, non-alphanumerics become '_'.
std::string normalize_type(std::string_view secret_type);

// Token `<{TYPE}_PLACEHOLDER_{seq:03}>`, salted with `_{n}` until it does not
// occur in `content`.
std::string make_placeholder_token(std::string_view secret_type, size_t sequence_id,
                                   std::string_view content);

// Splices placeholders at the match offsets, last match first. Matches must
// be in range and pairwise disjoint; their order does not matter. Sequence
// ids start at `first_sequence`, so several fields of one call can share a
// numbering.
std::expected<RedactionResult, RedactErrorInfo> redact(std::string_view content, const MatchList& matches,
                                                       size_t first_sequence = 1);

// Replaces every mapping token in `sanitized` with its raw value. Tokens not
// present in the mapping are left untouched.
std::string restore(std::string_view sanitized, const Mapping& mapping);

} // namespace ztgate
