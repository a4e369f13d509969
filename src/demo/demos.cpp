/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <fxnum/demo/demos.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>

#include <fmt/format.h>

#include <fxnum/config/validator.hpp>
#include <fxnum/family.hpp>
#include <fxnum/format.hpp>

namespace fxnum::demo {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

void basic(const config::DemoConfig& cfg, logging::Logger& log) {
    log.debug(fmt::format("basic: {} resolutions", cfg.basic_resolutions.size()));
    for (unsigned res : cfg.basic_resolutions) {
        const FamilyPtr family = Family::create(res);
        fmt::print("=== {} bits ===\n", res);
        const Number two(2, family);
        const Number root = two.sqrt();
        fmt::print("sqrt(2)   ~ {}\n", root);
        fmt::print("sqrt(2)^2 ~ {}\n", root * root);
        fmt::print("exp(1)    ~ {}\n", family->exp1());
        fmt::print("pi        ~ {}\n", family->pi());
        fmt::print("\n");
    }
}

void overflow(const config::DemoConfig& cfg, logging::Logger& log) {
    log.debug(fmt::format("overflow: resolution {}, step {}", cfg.overflow_resolution, cfg.overflow_step));
    fmt::print("{:>12}  {:>12}\n", "integer_bits", "exp overflow");
    for (const OverflowPoint& point :
         find_overflow_points(cfg.overflow_resolution, cfg.overflow_integer_bits, cfg.overflow_step)) {
        fmt::print("{:>12}  {:>12.4f}\n", point.integer_bits, point.x);
    }
    fmt::print("\n");
}

void speed(const config::DemoConfig& cfg, logging::Logger& log) {
    const unsigned long long count = cfg.speed_iterations;
    log.debug(fmt::format("speed: {} iterations per resolution", count));

    fmt::print("{:>5}  {:>10}  {:>9}  {:>12}\n", "bits", "operations", "seconds", "FLOPS");
    for (unsigned res : cfg.speed_resolutions) {
        const FamilyPtr family = Family::create(res);
        const Number lambda(3.6, family);
        Number x(0.5, family);

        // Logistic map: two multiplications and one subtraction per step
        const auto start = std::chrono::steady_clock::now();
        for (unsigned long long i = 0; i < count; ++i) {
            x = lambda * x * (1 - x);
        }
        const double elapsed = seconds_since(start);
        const double ops = 3.0 * static_cast<double>(count);
        fmt::print("{:>5}  {:>10}  {:>9.3f}  {:>12.3g}\n", res, static_cast<unsigned long long>(ops), elapsed,
                   elapsed > 0.0 ? ops / elapsed : 0.0);
    }

    fmt::print("\n{:>5}  {:>10}  {:>9}  {:>12}  {}\n", "bits", "roots", "seconds", "ops/s", "sqrt(2)");
    for (unsigned res : cfg.sqrt_resolutions) {
        const FamilyPtr family = Family::create(res, 4);
        const Number x(2, family);
        Number root = x;

        const auto start = std::chrono::steady_clock::now();
        for (unsigned long long i = 0; i < count; ++i) {
            root = x.sqrt();
        }
        const double elapsed = seconds_since(start);
        fmt::print("{:>5}  {:>10}  {:>9.3f}  {:>12.3g}  {}\n", res, count, elapsed,
                   elapsed > 0.0 ? static_cast<double>(count) / elapsed : 0.0, root.to_decimal_string(6));
    }
    fmt::print("\n");
}

void pi_plot(const config::DemoConfig& cfg, logging::Logger& log) {
    log.debug(fmt::format("piplot: {}..{} bits", cfg.pi_min_bits, cfg.pi_max_bits));
    fmt::print("{:>4}  {:<12}  {:>12}\n", "bits", "4 atan(1)", "error");
    for (const PiPoint& point : pi_convergence(cfg.pi_min_bits, cfg.pi_max_bits)) {
        fmt::print("{:>4}  {:<12.12}  {:>12.4e}\n", point.resolution, point.value, point.error);
    }
    fmt::print("\n");
}

void pi_accuracy_plot(const config::DemoConfig& cfg, logging::Logger& log) {
    log.debug(fmt::format("piaccplot: up to {} bits in steps of {}", cfg.accuracy_max_bits, cfg.accuracy_step));
    fmt::print("{:>5}  {:>14}  {:>14}\n", "bits", "atan lost bits", "pi lost bits");
    for (const AccuracyPoint& point : pi_accuracy(cfg.accuracy_step, cfg.accuracy_max_bits)) {
        fmt::print("{:>5}  {:>14.2f}  {:>14.2f}\n", point.resolution, point.atan_lost_bits, point.family_lost_bits);
    }
    fmt::print("\n");
}

void run(const config::DemoConfig& cfg, logging::Logger& log) {
    using Demo = std::function<void(const config::DemoConfig&, logging::Logger&)>;
    static const std::map<std::string, Demo> table = {
        {"basic", basic},
        {"overflow", overflow},
        {"speed", speed},
        {"piplot", pi_plot},
        {"piaccplot", pi_accuracy_plot},
    };

    const std::vector<std::string> selected = cfg.demos.empty() ? config::known_demos() : cfg.demos;
    for (const std::string& name : selected) {
        const auto it = table.find(name);
        if (it == table.end()) {
            throw std::invalid_argument(fmt::format("unknown demo '{}'", name));
        }
        log.info(fmt::format("running demo '{}'", name));
        it->second(cfg, log);
    }
}

} // namespace fxnum::demo
