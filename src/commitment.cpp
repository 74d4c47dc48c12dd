#include "commitment.hpp"
#include "redactor.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <unistd.h>
#include <fmt/format.h>

namespace ztgate {

namespace {

constexpr size_t kCommitmentIdLength = 16;
constexpr size_t kMaskedHashPrefix = 8;
constexpr size_t kMaxLookback = 64;

constexpr std::array<std::string_view, 16> kSensitiveNames{
    "API_KEY", "APIKEY", "SECRET", "PASSWORD", "PASSWD", "TOKEN", "PRIVATE_KEY", "CREDENTIAL",
    "AUTH", "ACCESS_KEY", "DATABASE_URL", "DB_PASS", "SESSION", "ENCRYPTION_KEY", "CLIENT_SECRET",
    "SIGNING_KEY"};

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

} // namespace

std::string utc_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z", tm.tm_year + 1900, tm.tm_mon + 1,
                       tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
}

QuorumValidator::QuorumValidator(int quorum, double entropy_threshold)
    : quorum_(std::max(1, quorum)), entropy_threshold_(entropy_threshold) {}

bool QuorumValidator::names_sensitive_variable(std::string_view content, size_t start) {
    size_t i = std::min(start, content.size());
    size_t skipped = 0;
    while (i > 0 && skipped < 4) {
        char c = content[i - 1];
        if (c == '=' || c == ':' || c == '"' || c == '\'' || c == ' ' || c == '\t') {
            --i;
            ++skipped;
        } else {
            break;
        }
    }
    size_t ident_end = i;
    while (i > 0 && ident_end - i < kMaxLookback && is_ident_char(content[i - 1])) --i;
    if (i == ident_end) return false;

    std::string ident(content.substr(i, ident_end - i));
    std::transform(ident.begin(), ident.end(), ident.begin(), [](unsigned char c) {
        return c == '-' || c == '.' ? '_' : static_cast<char>(std::toupper(c));
    });
    return std::any_of(kSensitiveNames.begin(), kSensitiveNames.end(),
                       [&](std::string_view n) { return ident.find(n) != std::string::npos; });
}

SignalVotes QuorumValidator::score(const SecretMatch& match, std::string_view content) const {
    SignalVotes v;
    v.pattern_matched = match.kind == DetectorKind::Pattern;
    v.entropy_over_threshold = shannon_entropy(match.raw_value) > entropy_threshold_;
    v.variable_name = names_sensitive_variable(content, match.start);
    return v;
}

MatchList QuorumValidator::confirmed(const MatchList& candidates, std::string_view content) const {
    MatchList out;
    for (const auto& m : candidates) {
        if (confirm(m, content)) out.push_back(m);
    }
    return out;
}

json::Value Commitment::to_json() const {
    json::Object o;
    o["commitmentId"] = commitment_id;
    o["secretHash"] = secret_hash;
    o["secretType"] = secret_type;
    o["maskedPlaceholder"] = masked_placeholder;
    o["timestamp"] = timestamp;
    o["context"] = context;
    return o;
}

Commitment Commitment::from_json(const json::Value& v) {
    Commitment c;
    c.commitment_id = v.get_string("commitmentId");
    c.secret_hash = v.get_string("secretHash");
    c.secret_type = v.get_string("secretType");
    c.masked_placeholder = v.get_string("maskedPlaceholder");
    c.timestamp = v.get_string("timestamp");
    if (v["context"].is_object()) c.context = v["context"].as_object();
    return c;
}

CommitmentBuilder::CommitmentBuilder(HashFunction hash)
    : hash_(std::move(hash)), process_id_(std::to_string(::getpid())) {}

std::expected<Commitment, HashErrorInfo> CommitmentBuilder::commit(const SecretMatch& match, std::string_view name,
                                                                   json::Object context) const {
    auto secret_hash = hash_(match.raw_value);
    if (!secret_hash) return std::unexpected(secret_hash.error());
    if (secret_hash->size() < kCommitmentIdLength) {
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "digest shorter than commitment id"});
    }

    Commitment c;
    c.timestamp = utc_timestamp();
    auto id_hash = hash_(fmt::format("{}:{}:{}:{}", name, *secret_hash, c.timestamp, process_id_));
    if (!id_hash) return std::unexpected(id_hash.error());
    if (id_hash->size() < kCommitmentIdLength) {
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "digest shorter than commitment id"});
    }

    c.commitment_id = id_hash->substr(0, kCommitmentIdLength);
    c.secret_type = match.type;
    c.masked_placeholder = fmt::format("<MASKED_{}_{}>", normalize_type(match.type),
                                       secret_hash->substr(0, kMaskedHashPrefix));
    c.secret_hash = std::move(*secret_hash);
    context["name"] = std::string(name);
    context["detector"] = std::string(to_string(match.kind));
    c.context = std::move(context);
    return c;
}

std::expected<bool, HashErrorInfo> CommitmentBuilder::matches(const Commitment& commitment,
                                                              std::string_view candidate) const {
    auto secret_hash = hash_(candidate);
    if (!secret_hash) return std::unexpected(secret_hash.error());
    if (*secret_hash != commitment.secret_hash) return false;
    return commitment.masked_placeholder.ends_with(fmt::format("_{}>", secret_hash->substr(0, kMaskedHashPrefix)));
}

} // namespace ztgate
