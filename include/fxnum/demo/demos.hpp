/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>

#include <fxnum/config/types.hpp>
#include <fxnum/logging/logger.hpp>
#include <fxnum/number.hpp>

namespace fxnum::demo {

// Smallest x (stepping from 0) whose exp(x) overflows a family with this integer width
struct OverflowPoint {
    unsigned integer_bits;
    double x;
};

struct PiPoint {
    unsigned resolution;
    std::string value;   // 4 atan(1) at this resolution
    double error;        // value - pi
};

struct AccuracyPoint {
    unsigned resolution;
    double atan_lost_bits;    // fractional bits lost by 4 atan(1)
    double family_lost_bits;  // fractional bits lost by the family's cached pi
};

// Throws std::invalid_argument when step does not round to a positive amount at resolution
std::vector<OverflowPoint> find_overflow_points(unsigned resolution, const std::vector<unsigned>& integer_bits,
                                                double step);

/**
 * @brief Fractional bits of approx wasted by accumulated roundoff.
 *
 * log2|approx - reference| + resolution(approx), evaluated in the reference
 * family. An exact match reports the negative width of the reference margin.
 */
double lost_bits(const Number& approx, const Number& reference);

std::vector<PiPoint> pi_convergence(unsigned min_bits, unsigned max_bits);
std::vector<AccuracyPoint> pi_accuracy(unsigned step, unsigned max_bits);

// Printing front ends
void basic(const config::DemoConfig& cfg, logging::Logger& log);
void overflow(const config::DemoConfig& cfg, logging::Logger& log);
void speed(const config::DemoConfig& cfg, logging::Logger& log);
void pi_plot(const config::DemoConfig& cfg, logging::Logger& log);
void pi_accuracy_plot(const config::DemoConfig& cfg, logging::Logger& log);

// Run the demos named in cfg.demos (every demo when empty), in order.
// Throws std::invalid_argument for an unknown name.
void run(const config::DemoConfig& cfg, logging::Logger& log);

} // namespace fxnum::demo
