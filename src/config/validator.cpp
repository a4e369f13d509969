#include <fxnum/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

namespace fxnum::config {

const std::vector<std::string>& known_demos() {
    static const std::vector<std::string> names{"basic", "overflow", "speed", "piplot", "piaccplot"};
    return names;
}

bool is_known_demo(const std::string& name, std::string& err) {
    const auto& names = known_demos();
    if (std::find(names.begin(), names.end(), name) != names.end()) return true;
    err = fmt::format("unknown demo '{}' (expected one of: {})", name, fmt::join(names, ", "));
    return false;
}

bool validate_bit_list(const std::vector<unsigned>& values, const std::string& key, std::string& err) {
    if (values.empty()) { err = fmt::format("'{}' must not be empty", key); return false; }
    for (unsigned v : values) {
        if (v == 0 || v > kMaxBits) {
            err = fmt::format("'{}' entries must be in [1, {}], got {}", key, kMaxBits, v); return false; }
    }
    return true;
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        std::size_t end = (comma == std::string::npos) ? text.size() : comma;
        std::string item = trim(text.substr(start, end - start));
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

bool parse_unsigned(const std::string& text, unsigned& out, std::string& err) {
    const std::string t = trim(text);
    if (t.empty()) { err = "empty value where a number was expected"; return false; }
    if (!std::all_of(t.begin(), t.end(), ::isdigit)) {
        err = fmt::format("'{}' must contain only digits", t); return false; }
    unsigned long v = 0;
    try { v = std::stoul(t); } catch (const std::exception&) { err = fmt::format("'{}' is out of range", t); return false; }
    if (v > 0xFFFFFFFFUL) { err = fmt::format("'{}' is out of range", t); return false; }
    out = static_cast<unsigned>(v);
    return true;
}

bool parse_unsigned_list(const std::string& text, std::vector<unsigned>& out, std::string& err) {
    std::vector<unsigned> values;
    for (const auto& item : split_list(text)) {
        unsigned v = 0;
        if (!parse_unsigned(item, v, err)) return false;
        values.push_back(v);
    }
    out = std::move(values);
    return true;
}

bool parse_positive_double(const std::string& text, double& out, std::string& err) {
    const std::string t = trim(text);
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (t.empty() || end != t.c_str() + t.size()) { err = fmt::format("'{}' is not a number", t); return false; }
    if (!std::isfinite(v) || v <= 0.0) { err = fmt::format("'{}' must be a positive number", t); return false; }
    out = v;
    return true;
}

} // namespace fxnum::config
