#include "log.hpp"

namespace ztgate {

namespace {

std::string_view level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "INFO";
    }
}

} // namespace

bool Log::set_level(std::string_view name) {
    if (name == "debug") set_level(LogLevel::Debug);
    else if (name == "info") set_level(LogLevel::Info);
    else if (name == "warn" || name == "warning") set_level(LogLevel::Warn);
    else if (name == "error") set_level(LogLevel::Error);
    else if (name == "off") set_level(LogLevel::Off);
    else return false;
    return true;
}

void Log::write(LogLevel lvl, std::string_view msg) {
    if (static_cast<int>(lvl) < level_ref().load()) return;
    std::string line = fmt::format("[ztgate] {}: {}\n", level_tag(lvl), msg);
    std::lock_guard<std::mutex> lock(get_mutex());
    write_all(line);
}

} // namespace ztgate
