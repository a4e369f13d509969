#include <fxnum/logging/fmt_logger.hpp>

#include <cstdio>

#include <fmt/core.h>

namespace fxnum::logging {

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

bool MemoryLogger::contains(std::string_view needle) const {
    for (const auto& entry : lines_) {
        if (entry.second.find(needle) != std::string::npos) return true;
    }
    return false;
}

void FmtLogger::write(Level level, std::string_view msg) {
    if (level == Level::Debug && !enable_debug_.load()) return;
    std::FILE* out = level == Level::Error ? stderr : stdout;
    if (tag_.empty()) {
        fmt::print(out, "[{}] {}\n", level_name(level), msg);
    } else {
        fmt::print(out, "[{}] {}: {}\n", level_name(level), tag_, msg);
    }
}

} // namespace fxnum::logging
