#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <regex>
#include <variant>
#include <expected>
#include <functional>

namespace ztgate {

struct GateConfig;

enum class DetectorKind {
    Pattern,
    Entropy
};

std::string_view to_string(DetectorKind kind);

inline constexpr double kPatternConfidence = 0.9;
inline constexpr double kEntropyConfidence = 0.7;
inline constexpr std::string_view kHighEntropyType = "HIGH_ENTROPY";

// A candidate secret. raw_value lives only for the duration of one gate call.
struct SecretMatch {
    std::string type;
    std::string raw_value;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;
    DetectorKind kind = DetectorKind::Pattern;

    size_t length() const { return end - start; }
    bool overlaps(const SecretMatch& o) const { return start < o.end && o.start < end; }
};

enum class DetectionError {
    RegexFailure,
    InvalidInput
};

struct DetectionErrorInfo {
    DetectionError error;
    std::string message;
};

using MatchList = std::vector<SecretMatch>;
using ValuePredicate = std::function<bool(std::string_view)>;

// Rejects placeholder-looking values: EXAMPLE, TEST, DUMMY, SAMPLE (any case).
bool not_test_pattern(std::string_view value);

// Named predicates usable from configuration; empty function for "none".
ValuePredicate validator_by_name(std::string_view name);

class PatternDetector {
public:
    PatternDetector(std::string type, const std::string& pattern, ValuePredicate validator = {});

    DetectorKind kind() const { return DetectorKind::Pattern; }
    const std::string& type() const { return type_; }

    std::expected<MatchList, DetectionErrorInfo> detect(std::string_view content) const;

private:
    std::string type_;
    std::regex pattern_;
    ValuePredicate validator_;

    void scan_window(std::string_view content, size_t base, size_t len,
                     std::set<std::pair<size_t, size_t>>& seen, MatchList& out) const;
};

class EntropyDetector {
public:
    explicit EntropyDetector(double threshold = 3.5, size_t min_length = 20);

    DetectorKind kind() const { return DetectorKind::Entropy; }
    double threshold() const { return threshold_; }

    std::expected<MatchList, DetectionErrorInfo> detect(std::string_view content) const;

    static bool is_token_char(char c);

private:
    double threshold_;
    size_t min_length_;
};

using Detector = std::variant<PatternDetector, EntropyDetector>;

// Winner per overlapping group: higher confidence, then earliest start, then
// longer span, then type name. Output is ordered by start offset.
MatchList resolve_overlaps(MatchList candidates);

class DetectorRegistry {
public:
    DetectorRegistry() = default;

    static DetectorRegistry from_config(const GateConfig& config);

    void add(Detector detector);
    void set_enabled(DetectorKind kind, bool enabled);
    bool is_enabled(DetectorKind kind) const { return disabled_.count(kind) == 0; }
    size_t count(DetectorKind kind) const;

    void set_parallel(bool parallel) { parallel_ = parallel; }

    // Resolved, start-ordered matches. Binary content (any NUL byte) yields none.
    MatchList detect(std::string_view content) const;

    // Every candidate from every enabled detector, before overlap resolution.
    MatchList detect_candidates(std::string_view content) const;

private:
    std::map<DetectorKind, std::vector<Detector>> detectors_;
    std::set<DetectorKind> disabled_;
    bool parallel_ = false;
};

} // namespace ztgate
