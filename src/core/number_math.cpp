/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/number.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "fxnum/math/solvers.hpp"

namespace fxnum {

using value_type = ScaledInteger::value_type;

namespace {

constexpr double kLog2E = 1.4426950408889634;

// Bits of the integer part of a value scaled by 2^w
unsigned integer_bits_of(const ScaledInteger& x, unsigned w) {
    const std::size_t bits = x.bit_length();
    return bits > w ? static_cast<unsigned>(bits - w) : 0u;
}

// Round a solver result computed at resolution w back into the family.
// The Number constructor performs the overflow check.
Number finish(const ScaledInteger& result, unsigned w, const FamilyPtr& family) {
    return Number::from_scaled(result.rescaled(w, family->resolution()), family);
}

/**
 * exp(arg) for an argument scaled by 2^arg_resolution, delivered in family.
 *
 * Results far outside the integer range fail before any series work is done;
 * borderline ones are computed and caught by the final range check. Negative
 * arguments whose result is below half a unit return zero.
 */
Number exp_scaled(const ScaledInteger& arg, unsigned arg_resolution, const FamilyPtr& family) {
    const unsigned res = family->resolution();
    const double x = arg.to_double(arg_resolution);

    unsigned result_bits = 0;
    if (!arg.is_negative()) {
        const double estimate = x * kLog2E;
        if (!(estimate <= static_cast<double>(family->integer_bits()) + 1.0)) {
            const std::size_t bits = std::isfinite(estimate) && estimate < 1e15
                ? static_cast<std::size_t>(estimate) + res
                : std::numeric_limits<std::size_t>::max();
            throw OverflowError(fmt::format("exp({:.6g}) overflows {}", x, family->describe()),
                                res, family->integer_bits(), bits, std::exp(x));
        }
        result_bits = static_cast<unsigned>(std::ceil(estimate));
    } else if (-x * kLog2E > static_cast<double>(res) + 2.0) {
        return Number(0, family);
    }

    // Squaring back doubles the error once per halving
    const unsigned w = res + Family::kGuardBits + integer_bits_of(arg, arg_resolution) + 1 + result_bits;
    const ScaledInteger raw = math::exp(arg.rescaled(arg_resolution, w), w);
    return finish(raw, w, family);
}

ScaledInteger asin_raw(const ScaledInteger& x, unsigned w, const Family& family) {
    const ScaledInteger one = ScaledInteger::one(w);
    const ScaledInteger magnitude = x.abs();
    if (magnitude > one) {
        throw DomainError(fmt::format("asin/acos argument {:.6g} outside [-1, 1]", x.to_double(w)));
    }
    if (magnitude == one) {
        const ScaledInteger half_pi = family.constant_raw(Constant::Pi, w).shifted(-1);
        return x.is_negative() ? -half_pi : half_pi;
    }
    const ScaledInteger root = math::sqrt(one - ScaledInteger::multiply(x, x, w), w);
    return math::atan(ScaledInteger::divide(x, root, w), w);
}

} // namespace

Number Number::sqrt() const {
    if (is_negative()) {
        throw DomainError(fmt::format("sqrt({}) is undefined", to_decimal_string()));
    }
    // Newton on the integer square root is exact to the last place, no guard bits needed
    return Number::from_scaled(math::sqrt(scaled_, resolution()), family_);
}

Number Number::exp() const {
    return exp_scaled(scaled_, resolution(), family_);
}

Number Number::log() const {
    if (scaled_.sign() <= 0) {
        throw DomainError(fmt::format("log({}) is undefined", to_decimal_string()));
    }
    const unsigned w = family_->guard_resolution();
    const ScaledInteger ln2 = family_->constant_raw(Constant::Log2, w);
    const ScaledInteger raw = math::log(scaled_.rescaled(resolution(), w), w, ln2);
    return finish(raw, w, family_);
}

Number Number::atan() const {
    const unsigned w = family_->guard_resolution() + 4;
    const ScaledInteger raw = math::atan(scaled_.rescaled(resolution(), w), w);
    return finish(raw, w, family_);
}

Number Number::sin() const {
    const unsigned w = family_->guard_resolution() + integer_bits_of(scaled_, resolution());
    const ScaledInteger pi = family_->constant_raw(Constant::Pi, w);
    return finish(math::sin_cos(scaled_.rescaled(resolution(), w), w, pi).first, w, family_);
}

Number Number::cos() const {
    const unsigned w = family_->guard_resolution() + integer_bits_of(scaled_, resolution());
    const ScaledInteger pi = family_->constant_raw(Constant::Pi, w);
    return finish(math::sin_cos(scaled_.rescaled(resolution(), w), w, pi).second, w, family_);
}

Number Number::tan() const {
    const unsigned w = family_->guard_resolution() + integer_bits_of(scaled_, resolution());
    const ScaledInteger pi = family_->constant_raw(Constant::Pi, w);
    const auto [s, c] = math::sin_cos(scaled_.rescaled(resolution(), w), w, pi);
    if (c.is_zero()) {
        throw DivisionByZero(fmt::format("tan({}) has a zero cosine", to_decimal_string()));
    }
    return finish(ScaledInteger::divide(s, c, w), w, family_);
}

Number Number::asin() const {
    const unsigned w = family_->guard_resolution() + 4;
    return finish(asin_raw(scaled_.rescaled(resolution(), w), w, *family_), w, family_);
}

Number Number::acos() const {
    const unsigned w = family_->guard_resolution() + 4;
    const ScaledInteger half_pi = family_->constant_raw(Constant::Pi, w).shifted(-1);
    const ScaledInteger raw = half_pi - asin_raw(scaled_.rescaled(resolution(), w), w, *family_);
    return finish(raw, w, family_);
}

Number Number::pow(long long exponent) const {
    if (exponent == 0) return lift(1);

    const bool invert = exponent < 0;
    unsigned long long remaining = invert
        ? static_cast<unsigned long long>(-(exponent + 1)) + 1ull
        : static_cast<unsigned long long>(exponent);

    if (is_zero()) {
        if (invert) throw DivisionByZero("zero raised to a negative power");
        return *this;
    }

    // log2|result| decides overflow (or underflow to zero) before squaring starts
    double log2_magnitude = std::log2(std::fabs(to_double()));
    if (!std::isfinite(log2_magnitude)) {
        log2_magnitude = static_cast<double>(scaled_.bit_length()) - resolution();
    }
    const double power_bits = log2_magnitude * static_cast<double>(remaining);
    const double result_bits = invert ? -power_bits : power_bits;
    if (result_bits > static_cast<double>(family_->integer_bits()) + 1.0) {
        throw OverflowError(fmt::format("{}^{} overflows {}", to_decimal_string(), exponent, family_->describe()),
                            resolution(), family_->integer_bits(),
                            static_cast<std::size_t>(std::min(result_bits, 1e15)) + resolution(),
                            std::pow(to_double(), static_cast<double>(exponent)));
    }
    if (result_bits < -(static_cast<double>(resolution()) + 2.0)) {
        return lift(0);
    }

    // Each multiplication rounds once; widen by the number of multiplications
    unsigned steps = 0;
    for (unsigned long long v = remaining; v > 0; v >>= 1) steps += 2;
    // Relative error turns into absolute error scaled by |x^n| (or lost bits when it is below one)
    const unsigned extra = static_cast<unsigned>(std::ceil(std::fabs(power_bits)));
    const unsigned w = family_->guard_resolution() + steps + extra;

    ScaledInteger base = scaled_.rescaled(resolution(), w);
    ScaledInteger result = ScaledInteger::one(w);
    while (true) {
        if (remaining & 1ull) result = ScaledInteger::multiply(result, base, w);
        remaining >>= 1;
        if (remaining == 0) break;
        base = ScaledInteger::multiply(base, base, w);
    }
    if (invert) result = ScaledInteger::divide(ScaledInteger::one(w), result, w);
    return finish(result, w, family_);
}

Number Number::pow(const Number& exponent) const {
    require_same_family(exponent, "pow");

    // Integral exponents keep negative bases legal and avoid the log round trip
    const value_type whole = exponent.scaled_.integer_part(resolution());
    const bool integral = ScaledInteger::from_integer(whole, resolution()) == exponent.scaled_;
    if (integral && whole <= std::numeric_limits<long long>::max() && whole >= std::numeric_limits<long long>::min()) {
        return pow(whole.convert_to<long long>());
    }

    if (is_zero()) {
        if (exponent.is_negative()) throw DivisionByZero("zero raised to a negative power");
        return *this;
    }
    if (is_negative()) {
        throw DomainError(fmt::format("{} raised to non-integer power {}", to_decimal_string(),
                                      exponent.to_decimal_string()));
    }

    // x^y = exp(y ln x); the error of y ln x is scaled by exp(y ln x), at most 2^integer_bits
    const unsigned w = family_->guard_resolution() + family_->integer_bits()
        + integer_bits_of(exponent.scaled_, resolution());
    const ScaledInteger ln2 = family_->constant_raw(Constant::Log2, w);
    const ScaledInteger ln_x = math::log(scaled_.rescaled(resolution(), w), w, ln2);
    const ScaledInteger t = ScaledInteger::multiply(exponent.scaled_.rescaled(resolution(), w), ln_x, w);
    return exp_scaled(t, w, family_);
}

} // namespace fxnum
