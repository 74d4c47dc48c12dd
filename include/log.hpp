#pragma once

#include <unistd.h>
#include <string_view>
#include <string>
#include <atomic>
#include <mutex>
#include <fmt/format.h>

namespace ztgate {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Lightweight leveled writer. Everything goes to stderr: stdout carries the
// hook response and must stay machine-readable.
class Log {
public:
    static void set_level(LogLevel level) { level_ref().store(static_cast<int>(level)); }
    static LogLevel level() { return static_cast<LogLevel>(level_ref().load()); }

    // Accepts "debug", "info", "warn", "error", "off"; unknown names keep the current level.
    static bool set_level(std::string_view name);

    template <typename... Args>
    static void debug(fmt::format_string<Args...> f, Args&&... args) {
        write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void info(fmt::format_string<Args...> f, Args&&... args) {
        write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void warn(fmt::format_string<Args...> f, Args&&... args) {
        write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void error(fmt::format_string<Args...> f, Args&&... args) {
        write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
    }

    // Unformatted line straight to stderr, used for user-facing hook messages.
    static void raw(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(s);
    }

private:
    static void write(LogLevel lvl, std::string_view msg);

    static void write_all(std::string_view s) {
        while (!s.empty()) {
            ssize_t n = ::write(STDERR_FILENO, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::atomic<int>& level_ref() {
        static std::atomic<int> lvl{static_cast<int>(LogLevel::Warn)};
        return lvl;
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace ztgate
