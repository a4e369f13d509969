#pragma once

#include <fxnum/logging/logger.hpp>

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

namespace fxnum::logging {

// fmt-backed console logger. INFO/WARN/DEBUG go to stdout, ERROR to stderr;
// DEBUG lines are dropped unless enabled.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(std::string tag = {}, bool enable_debug = false)
        : tag_(std::move(tag)), enable_debug_(enable_debug) {}

    void write(Level level, std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    std::string tag_;
    std::atomic<bool> enable_debug_{false};
};

} // namespace fxnum::logging
