/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <fxnum/demo/demos.hpp>

#include <stdexcept>

#include <fmt/format.h>

#include <fxnum/family.hpp>

namespace fxnum::demo {

// Margin of the reference family over the approximation being judged
static constexpr unsigned kReferenceBits = 40;

std::vector<OverflowPoint> find_overflow_points(unsigned resolution, const std::vector<unsigned>& integer_bits,
                                                double step) {
    std::vector<OverflowPoint> points;
    points.reserve(integer_bits.size());
    for (unsigned bits : integer_bits) {
        const FamilyPtr family = Family::create(resolution, bits);
        const Number increment(step, family);
        if (increment.is_zero() || increment.is_negative()) {
            throw std::invalid_argument(fmt::format("overflow step {} is not a positive amount at {} fractional bits",
                                                    step, resolution));
        }
        Number x(0.0, family);
        while (true) {
            try {
                (void)x.exp();
            } catch (const OverflowError&) {
                break;
            }
            x += increment;
        }
        points.push_back({bits, x.to_double()});
    }
    return points;
}

double lost_bits(const Number& approx, const Number& reference) {
    const Number eps = Number(approx, reference.family_ptr()) - reference;
    if (eps.is_zero()) {
        return static_cast<double>(approx.resolution()) - static_cast<double>(reference.resolution());
    }
    const Number bits = eps.abs().log() / reference.family().log2() + approx.resolution();
    return bits.to_double();
}

std::vector<PiPoint> pi_convergence(unsigned min_bits, unsigned max_bits) {
    const Number pi_true = Family::create(max_bits + kReferenceBits)->pi();
    std::vector<PiPoint> points;
    for (unsigned res = min_bits; res <= max_bits; ++res) {
        const FamilyPtr family = Family::create(res);
        const Number value = 4 * Number(1, family).atan();
        const Number error = Number(value, pi_true.family_ptr()) - pi_true;
        points.push_back({res, value.to_decimal_string(), error.to_double()});
    }
    return points;
}

std::vector<AccuracyPoint> pi_accuracy(unsigned step, unsigned max_bits) {
    std::vector<AccuracyPoint> points;
    for (unsigned bits = step; bits <= max_bits; bits += step) {
        const FamilyPtr accurate = Family::create(bits + kReferenceBits);
        const FamilyPtr family = Family::create(bits);
        const Number pi_true = accurate->pi();
        const Number atan_pi = 4 * Number(1, family).atan();
        points.push_back({bits, lost_bits(atan_pi, pi_true), lost_bits(family->pi(), pi_true)});
    }
    return points;
}

} // namespace fxnum::demo
