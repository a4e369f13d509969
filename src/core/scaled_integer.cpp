/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/scaled_integer.hpp"

#include <cmath>
#include <cstdint>

#include <fmt/format.h>

#include "fxnum/errors.hpp"

namespace fxnum {

using value_type = ScaledInteger::value_type;

value_type rounded_shift(const value_type& value, unsigned bits) {
    if (bits == 0) return value;
    value_type magnitude = boost::multiprecision::abs(value);
    value_type half = value_type(1) << (bits - 1);
    magnitude += half;
    magnitude >>= bits;
    return value.sign() < 0 ? value_type(-magnitude) : magnitude;
}

value_type rounded_quotient(const value_type& numerator, const value_type& denominator) {
    const bool negative = (numerator.sign() * denominator.sign()) < 0;
    value_type n = boost::multiprecision::abs(numerator);
    value_type d = boost::multiprecision::abs(denominator);
    // floor((2n + d) / 2d) == round(n / d) with ties away from zero
    value_type q = (2 * n + d) / (2 * d);
    return negative ? value_type(-q) : q;
}

ScaledInteger ScaledInteger::from_integer(const value_type& i, unsigned resolution) {
    return ScaledInteger(value_type(i << resolution));
}

ScaledInteger ScaledInteger::from_double(double value, unsigned resolution) {
    if (!std::isfinite(value)) {
        throw DomainError(fmt::format("cannot represent non-finite value {} in fixed point", value));
    }
    if (value == 0.0) return ScaledInteger();

    // value == mantissa * 2^exponent, |mantissa| in [0.5, 1), exact in 53 bits
    int exponent = 0;
    const double mantissa = std::frexp(value, &exponent);
    const auto digits = static_cast<std::int64_t>(std::ldexp(mantissa, 53));
    ScaledInteger exact{value_type(digits)};
    return exact.shifted(exponent - 53 + static_cast<int>(resolution));
}

ScaledInteger ScaledInteger::one(unsigned resolution) {
    return ScaledInteger(value_type(value_type(1) << resolution));
}

std::size_t ScaledInteger::bit_length() const {
    if (value_.is_zero()) return 0;
    value_type magnitude = boost::multiprecision::abs(value_);
    return static_cast<std::size_t>(boost::multiprecision::msb(magnitude)) + 1;
}

double ScaledInteger::to_double(unsigned resolution) const {
    if (value_.is_zero()) return 0.0;

    // Keep the top 64 bits so the conversion never overflows the mantissa path
    const std::size_t bits = bit_length();
    const unsigned drop = bits > 64 ? static_cast<unsigned>(bits - 64) : 0u;
    value_type top = boost::multiprecision::abs(value_);
    top >>= drop;
    const double mantissa = top.convert_to<double>();
    const double magnitude = std::ldexp(mantissa, static_cast<int>(drop) - static_cast<int>(resolution));
    return is_negative() ? -magnitude : magnitude;
}

value_type ScaledInteger::integer_part(unsigned resolution) const {
    value_type magnitude = boost::multiprecision::abs(value_);
    magnitude >>= resolution;
    return is_negative() ? value_type(-magnitude) : magnitude;
}

ScaledInteger ScaledInteger::divided_by(const value_type& divisor) const {
    if (divisor.is_zero()) {
        throw DivisionByZero("scaled integer divided by zero");
    }
    return ScaledInteger(rounded_quotient(value_, divisor));
}

ScaledInteger ScaledInteger::shifted(int bits) const {
    if (bits >= 0) return ScaledInteger(value_type(value_ << static_cast<unsigned>(bits)));
    return ScaledInteger(rounded_shift(value_, static_cast<unsigned>(-bits)));
}

ScaledInteger ScaledInteger::truncated(unsigned bits) const {
    if (bits == 0) return *this;
    if (!is_negative()) return ScaledInteger(value_type(value_ >> bits));
    // floor for negative values: -ceil(|v| / 2^bits)
    value_type magnitude = boost::multiprecision::abs(value_);
    value_type bias = (value_type(1) << bits) - 1;
    magnitude += bias;
    magnitude >>= bits;
    return ScaledInteger(value_type(-magnitude));
}

ScaledInteger ScaledInteger::rescaled(unsigned from, unsigned to) const {
    if (to >= from) return shifted(static_cast<int>(to - from));
    return shifted(-static_cast<int>(from - to));
}

ScaledInteger ScaledInteger::multiply(const ScaledInteger& a, const ScaledInteger& b, unsigned resolution) {
    value_type product = a.value_ * b.value_;
    return ScaledInteger(rounded_shift(product, resolution));
}

ScaledInteger ScaledInteger::divide(const ScaledInteger& a, const ScaledInteger& b, unsigned resolution) {
    if (b.is_zero()) {
        throw DivisionByZero("fixed-point division by zero");
    }
    value_type numerator = a.value_ << resolution;
    return ScaledInteger(rounded_quotient(numerator, b.value_));
}

} // namespace fxnum
