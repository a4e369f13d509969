/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>

namespace fxnum {

/**
 * Exact signed integer at an implicit binary point.
 *
 * The value represented is raw() / 2^resolution, where the resolution is not
 * stored here: it belongs to the owning Family (or to the working precision of
 * a solver). Storage is a boost::multiprecision::cpp_int, so no intermediate
 * result is ever truncated; range limits are enforced by Family::check_range.
 */
class ScaledInteger {
public:
    using value_type = boost::multiprecision::cpp_int;

    // Constructors
    ScaledInteger() = default;
    explicit ScaledInteger(value_type raw) : value_(std::move(raw)) {}

    // Factory methods
    static ScaledInteger from_raw(value_type raw) { return ScaledInteger(std::move(raw)); }

    // Integer scaled by 2^resolution (exact)
    static ScaledInteger from_integer(const value_type& i, unsigned resolution);

    // Finite double rounded to nearest at the given resolution.
    // Throws DomainError for NaN or infinity.
    static ScaledInteger from_double(double value, unsigned resolution);

    // 2^resolution, the scaled representation of 1
    static ScaledInteger one(unsigned resolution);

    // Accessors
    const value_type& raw() const { return value_; }
    int sign() const { return value_.sign(); }
    bool is_zero() const { return value_.is_zero(); }
    bool is_negative() const { return value_.sign() < 0; }

    // Number of significant bits of |raw|, 0 for zero
    std::size_t bit_length() const;

    // Conversions
    double to_double(unsigned resolution) const;

    // Integer part, truncated toward zero
    value_type integer_part(unsigned resolution) const;

    std::string to_string() const { return value_.str(); }

    // Arithmetic operators (exact)
    ScaledInteger operator+(const ScaledInteger& other) const { return ScaledInteger(value_type(value_ + other.value_)); }
    ScaledInteger operator-(const ScaledInteger& other) const { return ScaledInteger(value_type(value_ - other.value_)); }
    ScaledInteger operator-() const { return ScaledInteger(value_type(-value_)); }

    ScaledInteger& operator+=(const ScaledInteger& other) {
        value_ += other.value_;
        return *this;
    }

    ScaledInteger& operator-=(const ScaledInteger& other) {
        value_ -= other.value_;
        return *this;
    }

    ScaledInteger abs() const { return is_negative() ? -*this : *this; }

    // Multiply by a plain integer (exact)
    ScaledInteger scaled_by(const value_type& factor) const { return ScaledInteger(value_type(value_ * factor)); }

    // Divide by a plain integer, rounded to nearest (ties away from zero).
    // Throws DivisionByZero for a zero divisor.
    ScaledInteger divided_by(const value_type& divisor) const;

    // Shift by 2^bits: left for positive bits, rounded right shift for negative
    ScaledInteger shifted(int bits) const;

    // Right shift rounding toward minus infinity (used for rounded-down constants)
    ScaledInteger truncated(unsigned bits) const;

    // Re-express a value scaled by 2^from as one scaled by 2^to, rounding to nearest
    ScaledInteger rescaled(unsigned from, unsigned to) const;

    // Full-width product, rescaled back by 2^resolution and rounded to nearest
    static ScaledInteger multiply(const ScaledInteger& a, const ScaledInteger& b, unsigned resolution);

    // (a << resolution) / b rounded to nearest. Throws DivisionByZero when b is zero.
    static ScaledInteger divide(const ScaledInteger& a, const ScaledInteger& b, unsigned resolution);

    // Comparison operators
    bool operator==(const ScaledInteger& other) const { return value_ == other.value_; }
    bool operator!=(const ScaledInteger& other) const { return value_ != other.value_; }
    bool operator<(const ScaledInteger& other) const { return value_ < other.value_; }
    bool operator<=(const ScaledInteger& other) const { return value_ <= other.value_; }
    bool operator>(const ScaledInteger& other) const { return value_ > other.value_; }
    bool operator>=(const ScaledInteger& other) const { return value_ >= other.value_; }

private:
    value_type value_;
};

// Round-to-nearest division of magnitudes with the sign reapplied (ties away from zero)
ScaledInteger::value_type rounded_quotient(const ScaledInteger::value_type& numerator,
                                           const ScaledInteger::value_type& denominator);

// Right shift of a signed value by bits, rounded to nearest (ties away from zero)
ScaledInteger::value_type rounded_shift(const ScaledInteger::value_type& value, unsigned bits);

} // namespace fxnum
