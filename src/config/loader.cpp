#include <fxnum/config/loader.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fxnum/config/validator.hpp>

namespace fxnum::config {

static void apply_key_value(DemoConfig& cfg, const std::string& key, const std::string& val,
                            std::vector<std::string>& errs) {
    std::string e;
    auto number = [&](unsigned& target) { if (!parse_unsigned(val, target, e)) errs.push_back(fmt::format("{}: {}", key, e)); };
    auto list = [&](std::vector<unsigned>& target) { if (!parse_unsigned_list(val, target, e)) errs.push_back(fmt::format("{}: {}", key, e)); };

    if (key == "demos") cfg.demos = split_list(val);
    else if (key == "basic_resolutions") list(cfg.basic_resolutions);
    else if (key == "overflow_resolution") number(cfg.overflow_resolution);
    else if (key == "overflow_integer_bits") list(cfg.overflow_integer_bits);
    else if (key == "overflow_step") {
        if (!parse_positive_double(val, cfg.overflow_step, e)) errs.push_back(fmt::format("{}: {}", key, e));
    }
    else if (key == "speed_iterations") number(cfg.speed_iterations);
    else if (key == "speed_resolutions") list(cfg.speed_resolutions);
    else if (key == "sqrt_resolutions") list(cfg.sqrt_resolutions);
    else if (key == "pi_min_bits") number(cfg.pi_min_bits);
    else if (key == "pi_max_bits") number(cfg.pi_max_bits);
    else if (key == "accuracy_max_bits") number(cfg.accuracy_max_bits);
    else if (key == "accuracy_step") number(cfg.accuracy_step);
    else if (key == "debug") cfg.debug = (val == "1" || val == "true" || val == "yes");
    else errs.push_back(fmt::format("unknown key '{}'", key));
}

static std::string trim_key(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

static void load_key_value(DemoConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim_key(line.substr(0, eq));
        std::string val = trim_key(line.substr(eq + 1));
        apply_key_value(cfg, key, val, errs);
    }
}

static void load_json(DemoConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) { errs.push_back("configuration must be a JSON object"); return; }

    auto read_unsigned = [&](const char* key, unsigned& target) {
        if (!j.contains(key)) return;
        if (!j.at(key).is_number_unsigned()) { errs.push_back(fmt::format("'{}' must be a non-negative integer", key)); return; }
        target = j.at(key).get<unsigned>();
    };
    auto read_list = [&](const char* key, std::vector<unsigned>& target) {
        if (!j.contains(key)) return;
        const auto& v = j.at(key);
        if (!v.is_array()) { errs.push_back(fmt::format("'{}' must be an array", key)); return; }
        std::vector<unsigned> values;
        for (const auto& item : v) {
            if (!item.is_number_unsigned()) { errs.push_back(fmt::format("'{}' entries must be non-negative integers", key)); return; }
            values.push_back(item.get<unsigned>());
        }
        target = std::move(values);
    };

    if (j.contains("demos")) {
        const auto& v = j.at("demos");
        if (!v.is_array()) errs.push_back("'demos' must be an array of strings");
        else {
            std::vector<std::string> names;
            for (const auto& item : v) {
                if (!item.is_string()) { errs.push_back("'demos' must be an array of strings"); break; }
                names.push_back(item.get<std::string>());
            }
            cfg.demos = std::move(names);
        }
    }
    read_list("basic_resolutions", cfg.basic_resolutions);
    read_unsigned("overflow_resolution", cfg.overflow_resolution);
    read_list("overflow_integer_bits", cfg.overflow_integer_bits);
    if (j.contains("overflow_step")) {
        if (!j.at("overflow_step").is_number()) errs.push_back("'overflow_step' must be a number");
        else cfg.overflow_step = j.at("overflow_step").get<double>();
    }
    read_unsigned("speed_iterations", cfg.speed_iterations);
    read_list("speed_resolutions", cfg.speed_resolutions);
    read_list("sqrt_resolutions", cfg.sqrt_resolutions);
    read_unsigned("pi_min_bits", cfg.pi_min_bits);
    read_unsigned("pi_max_bits", cfg.pi_max_bits);
    read_unsigned("accuracy_max_bits", cfg.accuracy_max_bits);
    read_unsigned("accuracy_step", cfg.accuracy_step);
    if (j.contains("debug")) {
        if (!j.at("debug").is_boolean()) errs.push_back("'debug' must be a boolean");
        else cfg.debug = j.at("debug").get<bool>();
    }
}

std::vector<std::string> load_from_text(DemoConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    // Work on a copy so a rejected file leaves cfg untouched
    DemoConfig parsed = cfg;
    if (text[first_non_space] == '{') {
        try {
            load_json(parsed, text, errs);
        } catch (const nlohmann::json::exception& ex) {
            errs.push_back(fmt::format("failed to read configuration: {}", ex.what()));
        }
    } else {
        load_key_value(parsed, text, errs);
    }
    if (errs.empty()) cfg = std::move(parsed);
    return errs;
}

std::vector<std::string> load_from_file(DemoConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(DemoConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (const char* v = std::getenv("FXNUM_DEMOS")) cfg.demos = split_list(v);
    if (const char* v = std::getenv("FXNUM_SPEED_ITERATIONS")) {
        if (!parse_unsigned(v, cfg.speed_iterations, e)) errs.push_back(fmt::format("FXNUM_SPEED_ITERATIONS: {}", e));
    }
    if (const char* v = std::getenv("FXNUM_OVERFLOW_STEP")) {
        if (!parse_positive_double(v, cfg.overflow_step, e)) errs.push_back(fmt::format("FXNUM_OVERFLOW_STEP: {}", e));
    }
    if (const char* v = std::getenv("FXNUM_DEBUG")) {
        std::string s(v);
        cfg.debug = (s == "1" || s == "true" || s == "yes");
    }
    return errs;
}

std::vector<std::string> validate_final(const DemoConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    for (const auto& name : cfg.demos) {
        if (!is_known_demo(name, e)) errs.push_back(e);
    }
    if (!validate_bit_list(cfg.basic_resolutions, "basic_resolutions", e)) errs.push_back(e);
    if (!validate_bit_list({cfg.overflow_resolution}, "overflow_resolution", e)) errs.push_back(e);
    if (!validate_bit_list(cfg.overflow_integer_bits, "overflow_integer_bits", e)) errs.push_back(e);
    if (!validate_bit_list(cfg.speed_resolutions, "speed_resolutions", e)) errs.push_back(e);
    if (!validate_bit_list(cfg.sqrt_resolutions, "sqrt_resolutions", e)) errs.push_back(e);
    if (!validate_bit_list({cfg.pi_min_bits, cfg.pi_max_bits}, "pi_min_bits/pi_max_bits", e)) errs.push_back(e);
    if (!validate_bit_list({cfg.accuracy_step, cfg.accuracy_max_bits}, "accuracy_step/accuracy_max_bits", e)) errs.push_back(e);
    if (!(cfg.overflow_step > 0.0)) {
        errs.push_back("overflow_step must be positive");
    } else if (cfg.overflow_step < std::ldexp(1.0, -static_cast<int>(cfg.overflow_resolution))) {
        errs.push_back(fmt::format("overflow_step {} is below one unit (2^-{}) at overflow_resolution",
                                   cfg.overflow_step, cfg.overflow_resolution));
    }
    if (cfg.speed_iterations == 0) errs.push_back("speed_iterations must be positive");
    if (cfg.pi_min_bits > cfg.pi_max_bits) errs.push_back("pi_min_bits must not exceed pi_max_bits");
    if (cfg.accuracy_step > cfg.accuracy_max_bits) errs.push_back("accuracy_step must not exceed accuracy_max_bits");
    return errs;
}

} // namespace fxnum::config
