#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>
#include <fmt/format.h>

namespace ztgate {

std::string_view to_string(SecurityLevel level) {
    return level == SecurityLevel::FailSafe ? "FAIL_SAFE" : "FAIL_SECURE";
}

std::optional<SecurityLevel> parse_security_level(std::string_view s) {
    if (s == "FAIL_SAFE" || s == "fail_safe") return SecurityLevel::FailSafe;
    if (s == "FAIL_SECURE" || s == "fail_secure") return SecurityLevel::FailSecure;
    return std::nullopt;
}

std::vector<PatternConfig> GateConfig::default_patterns() {
    return {
        {"OPENAI_API_KEY", R"(sk-[a-zA-Z0-9]{48})"},
        {"ANTHROPIC_API_KEY", R"(sk-ant-[a-zA-Z0-9_-]{94}R)"},
        {"AWS_ACCESS_KEY", R"(AKIA[0-9A-Z]{16})"},
        {"GITHUB_TOKEN", R"(ghp_[A-Za-z0-9]{36}|github_pat_[A-Za-z0-9_]{82})"},
        {"GOOGLE_API_KEY", R"(AIza[0-9A-Za-z_-]{35})"},
        {"SLACK_TOKEN", R"(xox[baprs]-[0-9A-Za-z-]{10,72})"},
        {"JWT", R"(eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+)"},
        {"POSTGRESQL_URL", R"(postgres(ql)?://[^:\s/]+:[^@\s]+@[^/\s]+/[^?\s]+)", "none"},
        {"MYSQL_URL", R"(mysql://[^:\s/]+:[^@\s]+@[^/\s]+/[^?\s]+)", "none"},
        {"MONGODB_URL", R"(mongodb(\+srv)?://[^:\s/]+:[^@\s]+@[^/\s]+/[^?\s]+)", "none"},
        {"REDIS_URL", R"(redis://[^:\s/]*:[^@\s]+@[^/\s]+)", "none"},
        {"PRIVATE_KEY", R"(-----BEGIN (RSA |EC |OPENSSH |DSA )?PRIVATE KEY-----)", "none"},
    };
}

namespace {

bool known_validator(std::string_view name) {
    return name.empty() || name == "none" || name == "not_test_pattern";
}

std::unexpected<ConfigErrorInfo> invalid(std::string msg) {
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, std::move(msg)});
}

} // namespace

std::expected<GateConfig, ConfigErrorInfo> config_from_json(const json::Value& doc) {
    if (!doc.is_object()) return invalid("configuration root must be an object");

    GateConfig cfg;
    cfg.enabled = doc.get_bool("enabled", cfg.enabled);
    cfg.entropy_threshold = doc.get_number("entropyThreshold", cfg.entropy_threshold);
    cfg.entropy_enabled = doc.get_bool("entropyEnabled", cfg.entropy_enabled);
    cfg.audit_allow = doc.get_bool("auditAllow", cfg.audit_allow);
    cfg.parallel_detectors = doc.get_bool("parallelDetectors", cfg.parallel_detectors);
    cfg.log_level = doc.get_string("logLevel", cfg.log_level);

    double quorum = doc.get_number("quorum", cfg.quorum);
    if (quorum < 1 || quorum > 3) return invalid(fmt::format("quorum must be in [1, 3], got {}", quorum));
    cfg.quorum = static_cast<int>(quorum);

    if (cfg.entropy_threshold <= 0.0 || cfg.entropy_threshold > 8.0) {
        return invalid(fmt::format("entropyThreshold must be in (0, 8], got {}", cfg.entropy_threshold));
    }

    double min_len = doc.get_number("entropyMinLength", static_cast<double>(cfg.entropy_min_length));
    if (min_len < 1) return invalid("entropyMinLength must be positive");
    cfg.entropy_min_length = static_cast<size_t>(min_len);

    double max_scan = doc.get_number("maxScanBytes", static_cast<double>(cfg.max_scan_bytes));
    if (max_scan < 1) return invalid("maxScanBytes must be positive");
    cfg.max_scan_bytes = static_cast<size_t>(max_scan);

    double tail = doc.get_number("tailWindowBytes", static_cast<double>(cfg.tail_window_bytes));
    if (tail < 0) return invalid("tailWindowBytes must not be negative");
    cfg.tail_window_bytes = static_cast<size_t>(tail);

    if (doc.contains("securityLevel")) {
        auto level = parse_security_level(doc.get_string("securityLevel"));
        if (!level) return invalid(fmt::format("unknown securityLevel '{}'", doc.get_string("securityLevel")));
        cfg.security_level = *level;
    }

    if (doc.contains("onDetection")) {
        auto action = doc.get_string("onDetection");
        if (action == "block") cfg.on_detection = DetectionAction::Block;
        else if (action == "redact") cfg.on_detection = DetectionAction::Redact;
        else return invalid(fmt::format("unknown onDetection '{}'", action));
    }

    if (auto audit = doc.get_string("auditPath"); !audit.empty()) cfg.audit_path = audit;

    if (doc["patterns"].is_array()) {
        for (const auto& p : doc["patterns"].as_array()) {
            PatternConfig pc;
            pc.type = p.get_string("type");
            pc.pattern = p.get_string("pattern");
            pc.validator = p.get_string("validator", pc.validator);
            pc.enabled = p.get_bool("enabled", true);
            if (pc.type.empty()) return invalid("pattern entry without a type");
            if (!known_validator(pc.validator)) {
                return invalid(fmt::format("pattern {}: unknown validator '{}'", pc.type, pc.validator));
            }

            auto it = std::find_if(cfg.patterns.begin(), cfg.patterns.end(),
                                   [&](const PatternConfig& d) { return d.type == pc.type; });
            if (!pc.enabled) {
                if (it != cfg.patterns.end()) cfg.patterns.erase(it);
                continue;
            }
            if (pc.pattern.empty()) return invalid(fmt::format("pattern {}: empty regex", pc.type));
            try {
                std::regex compiled(pc.pattern);
            } catch (const std::regex_error& e) {
                return std::unexpected(ConfigErrorInfo{
                    ConfigError::InvalidPattern, fmt::format("pattern {}: {}", pc.type, e.what())});
            }
            if (it != cfg.patterns.end()) *it = std::move(pc);
            else cfg.patterns.push_back(std::move(pc));
        }
    }
    return cfg;
}

std::expected<GateConfig, ConfigErrorInfo> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ConfigErrorInfo{ConfigError::FileNotFound,
                                               fmt::format("config file not found: {}", path.string())});
    }
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ReadFailed,
                                               fmt::format("cannot open config file: {}", path.string())});
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto doc = json::parse(content);
    if (!doc) {
        return std::unexpected(ConfigErrorInfo{
            ConfigError::InvalidJson,
            fmt::format("{}: {} at offset {}", path.string(), doc.error().message, doc.error().offset)});
    }
    auto cfg = config_from_json(*doc);
    if (cfg) Log::debug("loaded configuration from {}", path.string());
    return cfg;
}

std::expected<GateConfig, ConfigErrorInfo> load_default_config() {
    std::vector<std::filesystem::path> candidates{"ztgate.json"};
    if (const char* home = std::getenv("HOME")) {
        candidates.emplace_back(std::filesystem::path(home) / ".ztgate" / "config.json");
    }
    std::error_code ec;
    for (const auto& c : candidates) {
        if (std::filesystem::exists(c, ec)) return load_config(c);
    }
    return GateConfig{};
}

std::filesystem::path default_audit_path() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
    return base / ".ztgate" / "audit_chain.jsonl";
}

} // namespace ztgate
