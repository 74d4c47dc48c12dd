#include "secret_scanner.hpp"
#include "config.hpp"
#include "hashing.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <future>
#include <tuple>
#include <type_traits>

namespace ztgate {

namespace {

// libstdc++ regex recursion grows with match length; long lines are scanned
// in overlapping windows to keep the stack bounded.
constexpr size_t kRegexWindow = 16 * 1024;
constexpr size_t kRegexOverlap = 1024;

// `<TYPE_PLACEHOLDER_001>` and `<MASKED_TYPE_1a2b3c4d>` are our own output.
bool is_gate_token(std::string_view content, size_t start, size_t end) {
    if (start == 0 || end >= content.size()) return false;
    if (content[start - 1] != '<' || content[end] != '>') return false;
    std::string_view token = content.substr(start, end - start);
    return token.find("_PLACEHOLDER_") != std::string_view::npos || token.starts_with("MASKED_");
}

// In `NAME=value` and `--flag=value` only the value is a candidate. Base64
// padding only trails, so an `=` followed by another token byte separates.
size_t assignment_value_start(std::string_view content, size_t start, size_t end) {
    for (size_t k = end - 1; k > start; --k) {
        if (content[k - 1] == '=' && content[k] != '=') return k;
    }
    return start;
}

bool has_letter_and_digit(std::string_view token) {
    bool has_alpha = false;
    bool has_digit = false;
    for (unsigned char c : token) {
        has_alpha = has_alpha || std::isalpha(c);
        has_digit = has_digit || std::isdigit(c);
    }
    return has_alpha && has_digit;
}

} // namespace

std::string_view to_string(DetectorKind kind) {
    return kind == DetectorKind::Pattern ? "pattern" : "entropy";
}

bool not_test_pattern(std::string_view value) {
    static const std::array<std::string_view, 4> kMarkers{"EXAMPLE", "TEST", "DUMMY", "SAMPLE"};
    std::string upper(value);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::none_of(kMarkers.begin(), kMarkers.end(),
                        [&](std::string_view m) { return upper.find(m) != std::string::npos; });
}

ValuePredicate validator_by_name(std::string_view name) {
    if (name == "not_test_pattern") return not_test_pattern;
    return {};
}

PatternDetector::PatternDetector(std::string type, const std::string& pattern, ValuePredicate validator)
    : type_(std::move(type)), pattern_(pattern, std::regex::ECMAScript | std::regex::optimize),
      validator_(std::move(validator)) {}

void PatternDetector::scan_window(std::string_view content, size_t base, size_t len,
                                  std::set<std::pair<size_t, size_t>>& seen, MatchList& out) const {
    const char* first = content.data() + base;
    const char* last = first + len;
    for (std::cregex_iterator it(first, last, pattern_), end; it != end; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;
        size_t start = base + static_cast<size_t>(m.position(0));
        size_t stop = start + static_cast<size_t>(m.length(0));
        if (!seen.emplace(start, stop).second) continue;

        std::string_view value = content.substr(start, stop - start);
        if (validator_ && !validator_(value)) continue;
        out.push_back(SecretMatch{type_, std::string(value), start, stop, kPatternConfidence,
                                  DetectorKind::Pattern});
    }
}

std::expected<MatchList, DetectionErrorInfo> PatternDetector::detect(std::string_view content) const {
    MatchList out;
    std::set<std::pair<size_t, size_t>> seen;
    try {
        size_t line_start = 0;
        while (line_start < content.size()) {
            size_t nl = content.find('\n', line_start);
            size_t line_end = nl == std::string_view::npos ? content.size() : nl;
            size_t line_len = line_end - line_start;

            if (line_len <= kRegexWindow) {
                scan_window(content, line_start, line_len, seen, out);
            } else {
                for (size_t w = 0; w < line_len; w += kRegexWindow - kRegexOverlap) {
                    size_t len = std::min(kRegexWindow, line_len - w);
                    scan_window(content, line_start + w, len, seen, out);
                    if (w + len >= line_len) break;
                }
            }
            line_start = line_end + 1;
        }
    } catch (const std::regex_error& e) {
        return std::unexpected(DetectionErrorInfo{DetectionError::RegexFailure, e.what()});
    }
    std::sort(out.begin(), out.end(), [](const SecretMatch& a, const SecretMatch& b) {
        return std::tie(a.start, a.end) < std::tie(b.start, b.end);
    });
    return out;
}

EntropyDetector::EntropyDetector(double threshold, size_t min_length)
    : threshold_(threshold), min_length_(min_length) {}

bool EntropyDetector::is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=' ||
           c == '_' || c == '-';
}

std::expected<MatchList, DetectionErrorInfo> EntropyDetector::detect(std::string_view content) const {
    MatchList out;
    size_t i = 0;
    while (i < content.size()) {
        if (!is_token_char(content[i])) {
            ++i;
            continue;
        }
        size_t run_start = i;
        while (i < content.size() && is_token_char(content[i])) ++i;
        size_t start = assignment_value_start(content, run_start, i);
        std::string_view token = content.substr(start, i - start);
        if (token.size() < min_length_ || !has_letter_and_digit(token)) continue;
        if (is_gate_token(content, start, i)) continue;
        if (shannon_entropy(token) > threshold_) {
            out.push_back(SecretMatch{std::string(kHighEntropyType), std::string(token), start, i,
                                      kEntropyConfidence, DetectorKind::Entropy});
        }
    }
    return out;
}

MatchList resolve_overlaps(MatchList candidates) {
    std::sort(candidates.begin(), candidates.end(), [](const SecretMatch& a, const SecretMatch& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.start != b.start) return a.start < b.start;
        if (a.length() != b.length()) return a.length() > b.length();
        return a.type < b.type;
    });

    MatchList accepted;
    for (auto& c : candidates) {
        bool clash = std::any_of(accepted.begin(), accepted.end(),
                                 [&](const SecretMatch& a) { return a.overlaps(c); });
        if (!clash) accepted.push_back(std::move(c));
    }
    std::sort(accepted.begin(), accepted.end(),
              [](const SecretMatch& a, const SecretMatch& b) { return a.start < b.start; });
    return accepted;
}

DetectorRegistry DetectorRegistry::from_config(const GateConfig& config) {
    DetectorRegistry reg;
    for (const auto& p : config.patterns) {
        if (!p.enabled) continue;
        reg.add(PatternDetector(p.type, p.pattern, validator_by_name(p.validator)));
    }
    reg.add(EntropyDetector(config.entropy_threshold, config.entropy_min_length));
    reg.set_enabled(DetectorKind::Entropy, config.entropy_enabled);
    reg.set_parallel(config.parallel_detectors);
    return reg;
}

void DetectorRegistry::add(Detector detector) {
    DetectorKind kind = std::visit([](const auto& d) { return d.kind(); }, detector);
    detectors_[kind].push_back(std::move(detector));
}

void DetectorRegistry::set_enabled(DetectorKind kind, bool enabled) {
    if (enabled) disabled_.erase(kind);
    else disabled_.insert(kind);
}

size_t DetectorRegistry::count(DetectorKind kind) const {
    auto it = detectors_.find(kind);
    return it == detectors_.end() ? 0 : it->second.size();
}

MatchList DetectorRegistry::detect_candidates(std::string_view content) const {
    MatchList all;
    if (content.empty()) return all;
    if (content.find('\0') != std::string_view::npos) {
        Log::debug("skipping binary content ({} bytes)", content.size());
        return all;
    }

    std::vector<const Detector*> active;
    for (const auto& [kind, list] : detectors_) {
        if (!is_enabled(kind)) continue;
        for (const auto& d : list) active.push_back(&d);
    }

    auto run = [content](const Detector* d) {
        return std::visit([content](const auto& det) { return det.detect(content); }, *d);
    };
    auto collect = [&all](std::expected<MatchList, DetectionErrorInfo> r, const Detector* d) {
        if (!r) {
            std::string name = std::visit(
                [](const auto& det) -> std::string {
                    if constexpr (std::is_same_v<std::decay_t<decltype(det)>, PatternDetector>) {
                        return det.type();
                    } else {
                        return std::string(kHighEntropyType);
                    }
                },
                *d);
            Log::warn("detector {} failed, ignoring its matches: {}", name, r.error().message);
            return;
        }
        all.insert(all.end(), std::make_move_iterator(r->begin()), std::make_move_iterator(r->end()));
    };

    if (parallel_ && active.size() > 1) {
        std::vector<std::future<std::expected<MatchList, DetectionErrorInfo>>> futures;
        futures.reserve(active.size());
        for (const Detector* d : active) futures.push_back(std::async(std::launch::async, run, d));
        // Collected in registration order so the result does not depend on scheduling.
        for (size_t i = 0; i < futures.size(); ++i) collect(futures[i].get(), active[i]);
    } else {
        for (const Detector* d : active) collect(run(d), d);
    }
    return all;
}

MatchList DetectorRegistry::detect(std::string_view content) const {
    return resolve_overlaps(detect_candidates(content));
}

} // namespace ztgate
