#include <fxnum/cli/args.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <fxnum/config/loader.hpp>

#ifndef FXNUM_VERSION
#define FXNUM_VERSION "0.0.0"
#endif

namespace fxnum::cli {

static bool report(const std::vector<std::string>& errs, const std::string& origin, fxnum::logging::Logger& log) {
    for (const auto& e : errs) log.error(fmt::format("{}: {}", origin, e));
    return errs.empty();
}

fxnum::config::ParseResult parse(int argc, char** argv, fxnum::logging::Logger& log) {
    fxnum::config::ParseResult pr;
    cxxopts::Options options("fxdemo", "Demonstrations of the fxnum fixed-point engine");
    // clang-format off
    options.add_options()
        ("a,all",   "Run every demo")
        ("config",  "Path to config file (fxdemo.conf)", cxxopts::value<std::string>()->default_value("fxdemo.conf"))
        ("d,debug", "Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit")
        ("demos",   "Demos to run (basic/overflow/speed/piplot/piaccplot)", cxxopts::value<std::vector<std::string>>());
    // clang-format on
    options.parse_positional({"demos"});
    options.positional_help("[demo...]");

    std::vector<std::string> cli_demos;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("fxdemo v{}", FXNUM_VERSION));
            pr.show_only = true;
            return pr;
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.all = result.count("all") > 0;
        if (result.count("demos")) cli_demos = result["demos"].as<std::vector<std::string>>();
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }

    fxnum::config::DemoConfig cfg;
    if (!report(fxnum::config::load_from_file(cfg, pr.config_path), pr.config_path, log)) return pr;
    if (!report(fxnum::config::apply_env_overrides(cfg), "environment", log)) return pr;

    if (pr.all) cfg.demos.clear();
    else if (!cli_demos.empty()) cfg.demos = cli_demos;
    cfg.debug = cfg.debug || pr.debug;

    if (!report(fxnum::config::validate_final(cfg), "configuration", log)) return pr;
    pr.cfg = cfg;
    return pr;
}

} // namespace fxnum::cli
