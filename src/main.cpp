#include "audit_chain.hpp"
#include "config.hpp"
#include "json.hpp"
#include "log.hpp"
#include "policy_gate.hpp"
#include "secret_scanner.hpp"
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fmt/format.h>

using namespace ztgate;

namespace {

constexpr int kExitAllow = 0;
constexpr int kExitError = 1;
constexpr int kExitBlock = 2;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd, config_path, audit_path;
    std::vector<std::string> args;
    std::optional<size_t> limit;
    std::optional<GateConfig> config;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    std::string result_message;
};

void print_usage(const char* program_name) {
    std::cerr << "Zero-trust secret gate for AI tool calls\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  hook      Read a tool invocation on stdin, print the sanitized invocation.\n"
              << "            Exit 0 allows the call, exit 2 blocks it (reason on stderr).\n"
              << "  verify    Verify the audit chain; exit 0 if intact, 1 otherwise\n"
              << "  scan      Print secret types and offsets found on stdin\n"
              << "  log       Print audit entries, oldest first\n"
              << "  stats     Print audit chain statistics and integrity\n"
              << "  check <commitment-id>\n"
              << "            Exit 0 if the value on stdin is the committed secret, 1 otherwise\n\n"
              << "Options:\n"
              << "  --config <file>   Configuration file (default ./ztgate.json, ~/.ztgate/config.json)\n"
              << "  --audit <file>    Audit chain file (default ~/.ztgate/audit_chain.jsonl)\n"
              << "  --limit <n>       log: only the newest n entries\n";
}

std::string read_stdin() {
    return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
}

int cmd_hook(const GateConfig& config) {
    auto doc = json::parse(read_stdin());
    if (!doc || !doc->is_object()) {
        std::string msg = doc ? "hook input is not a JSON object" : fmt::format("invalid hook input: {}", doc.error().message);
        if (config.security_level == SecurityLevel::FailSafe) {
            Log::warn("{}; allowing (FAIL_SAFE)", msg);
            return kExitAllow;
        }
        Log::raw(fmt::format("ztgate: blocked: {}\n", msg));
        return kExitBlock;
    }

    AuditChain chain(config.audit_path);
    if (auto r = chain.open(); !r) {
        Log::warn("audit chain {} unavailable: {}", config.audit_path.string(), r.error().message);
    }

    PolicyGate gate(config, chain);
    GateDecision d = gate.process(ToolInvocation{doc->get_string("tool_name"), (*doc)["tool_input"]});
    chain.close();

    for (const auto& w : d.warnings) Log::warn("{}", w);
    if (!d.allowed()) {
        Log::raw(fmt::format("ztgate: {}\n", d.reason));
        return kExitBlock;
    }

    if (d.sanitized_input) doc->as_object()["tool_input"] = std::move(*d.sanitized_input);
    std::cout << json::dump(*doc) << "\n";
    return kExitAllow;
}

int cmd_verify(const GateConfig& config) {
    AuditChain chain(config.audit_path);
    IntegrityReport report = chain.verify_integrity();
    if (report.ok) {
        std::cout << fmt::format("{}: intact, {} entries\n", config.audit_path.string(), report.entries_checked);
        return 0;
    }
    if (report.first_violation) {
        std::cout << fmt::format("{}: violation at sequence {}: {}\n", config.audit_path.string(),
                                 *report.first_violation, report.detail);
    } else {
        std::cout << fmt::format("{}: cannot verify: {}\n", config.audit_path.string(), report.detail);
    }
    return kExitError;
}

int cmd_scan(const GateConfig& config) {
    AuditChain scratch;
    PolicyGate gate(config, scratch);
    QuorumValidator validator(config.quorum, config.entropy_threshold);

    std::string input = read_stdin();
    bool truncated = false;
    MatchList matches = validator.confirmed(gate.scan_text(input, truncated), input);
    for (const auto& m : matches) {
        std::cout << fmt::format("{}\t{}\t{}\t{:.2f}\t{}\n", m.type, m.start, m.end, m.confidence, to_string(m.kind));
    }
    if (truncated) Log::warn("input exceeded the scan ceiling; only head and tail were scanned");
    return 0;
}

int cmd_log(const GateConfig& config, std::optional<size_t> limit) {
    AuditChain chain(config.audit_path);
    auto entries = chain.entries(limit);
    if (!entries) {
        std::cerr << "Error: " << entries.error().message << "\n";
        return kExitError;
    }
    for (const auto& e : *entries) {
        std::vector<std::string> types;
        for (const auto& c : e.commitments) types.push_back(c.secret_type);
        std::cout << fmt::format("{}\t{}\t{}\t{}\t{}\t{}\n", e.sequence_number, e.timestamp, to_string(e.decision),
                                 e.tool_name, fmt::join(types, ","), e.reason);
    }
    return 0;
}

int cmd_stats(const GateConfig& config) {
    AuditChain chain(config.audit_path);
    auto s = chain.stats();
    if (!s) {
        std::cerr << "Error: " << s.error().message << "\n";
        return kExitError;
    }
    std::cout << fmt::format("chain file:       {}\n", config.audit_path.string())
              << fmt::format("total entries:    {}\n", s->total_entries)
              << fmt::format("allowed:          {}\n", s->allowed)
              << fmt::format("blocked:          {}\n", s->blocked)
              << fmt::format("commitments:      {}\n", s->commitments)
              << fmt::format("truncated scans:  {}\n", s->truncated_scans)
              << fmt::format("earliest:         {}\n", s->earliest_timestamp.empty() ? "-" : s->earliest_timestamp)
              << fmt::format("latest:           {}\n", s->latest_timestamp.empty() ? "-" : s->latest_timestamp)
              << fmt::format("chain valid:      {}\n", s->integrity.ok ? "yes" : "no");
    if (!s->integrity.ok) std::cout << fmt::format("integrity:        {}\n", s->integrity.detail);
    return s->integrity.ok ? 0 : kExitError;
}

int cmd_check(const GateConfig& config, const std::string& commitment_id) {
    std::string candidate = read_stdin();
    while (!candidate.empty() && (candidate.back() == '\n' || candidate.back() == '\r')) candidate.pop_back();

    AuditChain chain(config.audit_path);
    auto entries = chain.entries();
    if (!entries) {
        std::cerr << "Error: " << entries.error().message << "\n";
        return kExitError;
    }
    CommitmentBuilder builder;
    for (const auto& e : *entries) {
        auto it = std::find_if(e.commitments.begin(), e.commitments.end(),
                               [&](const Commitment& c) { return c.commitment_id == commitment_id; });
        if (it == e.commitments.end()) continue;

        auto same = builder.matches(*it, candidate);
        if (!same) {
            std::cerr << "Error: " << same.error().message << "\n";
            return kExitError;
        }
        std::cout << fmt::format("{}: {} ({}, entry {})\n", commitment_id, *same ? "match" : "no match",
                                 it->secret_type, e.sequence_number);
        return *same ? 0 : kExitError;
    }
    std::cerr << fmt::format("commitment {} not found in {}\n", commitment_id, config.audit_path.string());
    return kExitError;
}

std::optional<size_t> parse_limit(const std::string& s) {
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return n;
}

} // namespace

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = kExitError;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    if (a == "--config" && i + 1 < ctx.argc) ctx.config_path = ctx.argv[++i];
                    else if (a == "--audit" && i + 1 < ctx.argc) ctx.audit_path = ctx.argv[++i];
                    else if (a == "--limit" && i + 1 < ctx.argc) {
                        std::string v = ctx.argv[++i];
                        ctx.limit = parse_limit(v);
                        if (!ctx.limit) ctx.error_message = "Invalid --limit: " + v;
                    } else ctx.args.push_back(a);
                }
                if (!ctx.error_message.empty()) {
                    ctx.exit_code = kExitError;
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand: {
                static const std::vector<std::string> kCommands{"hook", "verify", "scan", "log", "stats", "check"};
                if (std::find(kCommands.begin(), kCommands.end(), ctx.cmd) == kCommands.end()) {
                    ctx.exit_code = kExitError;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }
                if (ctx.cmd == "check" && ctx.args.size() != 1) {
                    ctx.exit_code = kExitError;
                    ctx.error_message = "check takes one commitment id";
                    state = FSMState::Error;
                    break;
                }
                if (ctx.cmd != "check" && !ctx.args.empty()) {
                    ctx.exit_code = kExitError;
                    ctx.error_message = "Unexpected argument: " + ctx.args.front();
                    state = FSMState::Error;
                    break;
                }

                auto cfg = ctx.config_path.empty() ? load_default_config() : load_config(ctx.config_path);
                if (!cfg) {
                    // A hook that cannot load its policy must not let the call through.
                    ctx.exit_code = ctx.cmd == "hook" ? kExitBlock : kExitError;
                    ctx.error_message = cfg.error().message;
                    state = FSMState::Error;
                    break;
                }
                if (!ctx.audit_path.empty()) cfg->audit_path = ctx.audit_path;
                if (cfg->audit_path.empty()) cfg->audit_path = default_audit_path();

                const char* env_level = std::getenv("ZTGATE_LOG_LEVEL");
                std::string level = env_level ? env_level : cfg->log_level;
                if (!Log::set_level(level)) Log::warn("unknown log level '{}'", level);

                ctx.config = std::move(*cfg);
                Log::debug("PreCommand: {} (audit {})", ctx.cmd, ctx.config->audit_path.string());
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                if (ctx.cmd == "hook") {
                    ctx.exit_code = cmd_hook(*ctx.config);
                    ctx.result_message = ctx.exit_code == kExitAllow ? "allowed" : "blocked";
                } else if (ctx.cmd == "verify") {
                    ctx.exit_code = cmd_verify(*ctx.config);
                    ctx.result_message = ctx.exit_code == 0 ? "chain intact" : "chain broken";
                } else if (ctx.cmd == "scan") {
                    ctx.exit_code = cmd_scan(*ctx.config);
                    ctx.result_message = "scan finished";
                } else if (ctx.cmd == "log") {
                    ctx.exit_code = cmd_log(*ctx.config, ctx.limit);
                    ctx.result_message = "log printed";
                } else if (ctx.cmd == "stats") {
                    ctx.exit_code = cmd_stats(*ctx.config);
                    ctx.result_message = ctx.exit_code == 0 ? "stats printed" : "chain broken";
                } else {
                    ctx.exit_code = cmd_check(*ctx.config, ctx.args.front());
                    ctx.result_message = ctx.exit_code == 0 ? "commitment matches" : "no match";
                }
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto us = std::chrono::duration_cast<std::chrono::microseconds>(ctx.end_time - ctx.start_time).count();
                    Log::debug("{}: {} in {} us", ctx.cmd, ctx.result_message, us);
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
