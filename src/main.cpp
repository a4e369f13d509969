/*
 * fxdemo: demonstrations of the fxnum fixed-point engine
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <exception>
#include <stdexcept>

#include <fmt/core.h>

#include <fxnum/cli/args.hpp>
#include <fxnum/config/validator.hpp>
#include <fxnum/demo/demos.hpp>
#include <fxnum/errors.hpp>
#include <fxnum/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    fxnum::logging::FmtLogger log("fxdemo");
    auto pr = fxnum::cli::parse(argc, argv, log);
    if (pr.show_only) return 0;
    if (!pr.cfg) return 1;

    const auto& cfg = *pr.cfg;
    log.set_debug(cfg.debug);
    log.debug(fmt::format("config: {} demo(s) selected, {} speed iterations",
                          cfg.demos.empty() ? fxnum::config::known_demos().size() : cfg.demos.size(), cfg.speed_iterations));

    try {
        fxnum::demo::run(cfg, log);
    } catch (const fxnum::FixedPointError& e) {
        log.error(fmt::format("fixed-point failure: {}", e.what()));
        return 2;
    } catch (const std::exception& e) {
        log.error(fmt::format("demo failed: {}", e.what()));
        return 2;
    }
    return 0;
}
