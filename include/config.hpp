#pragma once

#include "json.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <filesystem>
#include <optional>

namespace ztgate {

enum class SecurityLevel {
    FailSafe,   // internal errors allow, with a warning
    FailSecure  // internal errors block
};

enum class DetectionAction {
    Block,
    Redact
};

std::string_view to_string(SecurityLevel level);
std::optional<SecurityLevel> parse_security_level(std::string_view s);

struct PatternConfig {
    std::string type;
    std::string pattern;
    std::string validator = "not_test_pattern";
    bool enabled = true;
};

struct GateConfig {
    bool enabled = true;
    std::vector<PatternConfig> patterns = default_patterns();
    double entropy_threshold = 3.5;
    size_t entropy_min_length = 20;
    bool entropy_enabled = true;
    int quorum = 1;
    SecurityLevel security_level = SecurityLevel::FailSecure;
    DetectionAction on_detection = DetectionAction::Block;
    size_t max_scan_bytes = 256 * 1024;
    size_t tail_window_bytes = 4 * 1024;
    bool audit_allow = false;
    bool parallel_detectors = false;
    std::filesystem::path audit_path;
    std::string log_level = "warn";

    static std::vector<PatternConfig> default_patterns();
};

enum class ConfigError {
    FileNotFound,
    ReadFailed,
    InvalidJson,
    InvalidPattern,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
};

// Overlay the members present in `doc` on top of the defaults. Patterns are
// merged by type: an entry replaces the default of the same type, and an
// entry with "enabled": false removes it.
std::expected<GateConfig, ConfigErrorInfo> config_from_json(const json::Value& doc);

std::expected<GateConfig, ConfigErrorInfo> load_config(const std::filesystem::path& path);

// First existing file of ./ztgate.json, ~/.ztgate/config.json; defaults otherwise.
std::expected<GateConfig, ConfigErrorInfo> load_default_config();

std::filesystem::path default_audit_path();

} // namespace ztgate
