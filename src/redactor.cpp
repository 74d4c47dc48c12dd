#include "redactor.hpp"
#include "hashing.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace ztgate {

Mapping::~Mapping() {
    clear();
}

Mapping& Mapping::operator=(Mapping&& other) noexcept {
    if (this != &other) {
        clear();
        entries_ = std::move(other.entries_);
        other.entries_.clear();
    }
    return *this;
}

void Mapping::add(Placeholder placeholder, std::string raw_value) {
    entries_.push_back(Entry{std::move(placeholder), std::move(raw_value)});
}

void Mapping::append(Mapping&& other) {
    for (auto& e : other.entries_) entries_.push_back(std::move(e));
    other.entries_.clear();
}

void Mapping::clear() {
    for (auto& e : entries_) secure_wipe(e.raw_value);
    entries_.clear();
}

const std::string* Mapping::find(std::string_view token) const {
    for (const auto& e : entries_) {
        if (e.placeholder.token == token) return &e.raw_value;
    }
    return nullptr;
}

std::string normalize_type(std::string_view secret_type) {
    std::string out;
    out.reserve(secret_type.size());
    for (char c : secret_type) {
        unsigned char u = static_cast<unsigned char>(c);
        out += std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_';
    }
    return out.empty() ? std::string("SECRET") : out;
}

std::string make_placeholder_token(std::string_view secret_type, size_t sequence_id,
                                   std::string_view content) {
    std::string base = fmt::format("<{}_PLACEHOLDER_{:03}", normalize_type(secret_type), sequence_id);
    std::string token = base + ">";
    for (size_t salt = 1; content.find(token) != std::string_view::npos; ++salt) {
        token = fmt::format("{}_{}>", base, salt);
    }
    return token;
}

std::expected<RedactionResult, RedactErrorInfo> redact(std::string_view content, const MatchList& matches,
                                                       size_t first_sequence) {
    RedactionResult result;
    if (matches.empty()) {
        result.sanitized = std::string(content);
        return result;
    }

    // Offsets are captured here, before any splice.
    std::vector<const SecretMatch*> order;
    order.reserve(matches.size());
    for (const auto& m : matches) {
        if (m.start >= m.end || m.end > content.size()) {
            return std::unexpected(RedactErrorInfo{
                RedactError::OutOfRange,
                fmt::format("match [{}, {}) outside content of {} bytes", m.start, m.end, content.size())});
        }
        order.push_back(&m);
    }
    std::sort(order.begin(), order.end(),
              [](const SecretMatch* a, const SecretMatch* b) { return a->start < b->start; });
    for (size_t i = 1; i < order.size(); ++i) {
        if (order[i]->start < order[i - 1]->end) {
            return std::unexpected(RedactErrorInfo{
                RedactError::OverlappingMatches,
                fmt::format("matches [{}, {}) and [{}, {}) overlap", order[i - 1]->start,
                            order[i - 1]->end, order[i]->start, order[i]->end)});
        }
    }

    std::vector<std::string> tokens(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        size_t seq = first_sequence + i;
        tokens[i] = make_placeholder_token(order[i]->type, seq, content);
        result.mapping.add(Placeholder{tokens[i], order[i]->type, seq},
                           std::string(content.substr(order[i]->start, order[i]->length())));
    }

    std::string out(content);
    for (size_t i = order.size(); i-- > 0;) {
        out.replace(order[i]->start, order[i]->length(), tokens[i]);
    }
    result.sanitized = std::move(out);
    return result;
}

std::string restore(std::string_view sanitized, const Mapping& mapping) {
    if (mapping.empty()) return std::string(sanitized);

    std::string out;
    out.reserve(sanitized.size());
    size_t pos = 0;
    while (pos < sanitized.size()) {
        size_t open = sanitized.find('<', pos);
        if (open == std::string_view::npos) {
            out.append(sanitized.substr(pos));
            break;
        }
        out.append(sanitized.substr(pos, open - pos));
        size_t close = sanitized.find('>', open + 1);
        if (close != std::string_view::npos) {
            if (const std::string* raw = mapping.find(sanitized.substr(open, close - open + 1))) {
                out.append(*raw);
                pos = close + 1;
                continue;
            }
        }
        out += '<';
        pos = open + 1;
    }
    return out;
}

} // namespace ztgate
