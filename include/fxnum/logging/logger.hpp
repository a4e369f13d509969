#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fxnum::logging {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

const char* level_name(Level level);

class Logger {
public:
    virtual ~Logger() = default;
    virtual void write(Level level, std::string_view msg) = 0;

    void info(std::string_view msg) { write(Level::Info, msg); }
    void warn(std::string_view msg) { write(Level::Warn, msg); }
    void error(std::string_view msg) { write(Level::Error, msg); }
    void debug(std::string_view msg) { write(Level::Debug, msg); }
};

// Keeps every line in memory; used by tests to inspect CLI and demo output
class MemoryLogger : public Logger {
public:
    void write(Level level, std::string_view msg) override { lines_.emplace_back(level, std::string(msg)); }

    const std::vector<std::pair<Level, std::string>>& lines() const { return lines_; }
    bool contains(std::string_view needle) const;

private:
    std::vector<std::pair<Level, std::string>> lines_;
};

} // namespace fxnum::logging
