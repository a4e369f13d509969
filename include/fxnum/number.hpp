/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "fxnum/errors.hpp"
#include "fxnum/family.hpp"
#include "fxnum/scaled_integer.hpp"

namespace fxnum {

/**
 * Fixed-point value bound to one Family.
 *
 * Holds value * 2^resolution exactly. Every operation returns a new Number and
 * range-checks it against the family (OverflowError instead of wrapping).
 * Binary operations need equal families (FamilyMismatch otherwise); integer
 * and floating literals are promoted into the family of the other operand.
 */
class Number {
public:
    // Constructors
    template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    Number(T value, FamilyPtr family)
        : Number(ScaledInteger::from_integer(ScaledInteger::value_type(value), resolution_of(family)),
                 family) {}

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Number(T value, FamilyPtr family)
        : Number(ScaledInteger::from_double(static_cast<double>(value), resolution_of(family)),
                 family) {}

    // Decimal text: [+-]digits[.digits][(e|E)[+-]digits]. Throws ParseError.
    Number(std::string_view text, FamilyPtr family);
    Number(const char* text, FamilyPtr family) : Number(std::string_view(text), std::move(family)) {}

    // Re-express a number in another family, rounding to nearest
    Number(const Number& other, FamilyPtr family);

    Number(const Number&) = default;
    Number(Number&&) noexcept = default;
    Number& operator=(const Number&) = default;
    Number& operator=(Number&&) noexcept = default;

    // Factory methods
    static Number from_scaled(ScaledInteger scaled, FamilyPtr family) {
        return Number(std::move(scaled), std::move(family));
    }

    // Accessors
    const Family& family() const { return *family_; }
    const FamilyPtr& family_ptr() const { return family_; }
    const ScaledInteger& scaled() const { return scaled_; }
    unsigned resolution() const { return family_->resolution(); }

    bool is_zero() const { return scaled_.is_zero(); }
    bool is_negative() const { return scaled_.is_negative(); }

    // Conversions
    double to_double() const { return scaled_.to_double(resolution()); }
    explicit operator double() const { return to_double(); }

    // Truncated toward zero; throws OverflowError if it does not fit in long long
    long long to_int() const;

    // digits < 0 selects ceil(resolution * log10(2)) fractional digits
    std::string to_decimal_string(int digits = -1) const;

    // Arithmetic operators
    Number operator+(const Number& other) const;
    Number operator-(const Number& other) const;
    Number operator*(const Number& other) const;
    Number operator/(const Number& other) const;
    Number operator-() const;
    Number operator+() const { return *this; }

    Number& operator+=(const Number& other) { return *this = *this + other; }
    Number& operator-=(const Number& other) { return *this = *this - other; }
    Number& operator*=(const Number& other) { return *this = *this * other; }
    Number& operator/=(const Number& other) { return *this = *this / other; }

    // Three-way comparison: negative, zero or positive. Throws FamilyMismatch.
    int compare(const Number& other) const;

    // Literal promotion (integer or floating) into this number's family
    template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    Number lift(T value) const { return Number(value, family_); }

    template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    int compare(T value) const { return compare(lift(value)); }

    Number abs() const;

    // Transcendental functions (number_math.cpp)
    Number sqrt() const;
    Number exp() const;
    Number log() const;
    Number atan() const;
    Number sin() const;
    Number cos() const;
    Number tan() const;
    Number asin() const;
    Number acos() const;
    Number pow(long long exponent) const;
    Number pow(const Number& exponent) const;

private:
    Number(ScaledInteger scaled, FamilyPtr family);

    static unsigned resolution_of(const FamilyPtr& family);

    // Throws FamilyMismatch unless both operands share equal families
    void require_same_family(const Number& other, const char* operation) const;

    ScaledInteger scaled_;
    FamilyPtr family_;
};

template <typename T>
using EnableIfLiteral = std::enable_if_t<std::is_arithmetic_v<T>, int>;

// Mixed arithmetic with literals, promoted into the family of the Number operand
template <typename T, EnableIfLiteral<T> = 0>
inline Number operator+(const Number& a, T b) { return a + a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number operator+(T a, const Number& b) { return b.lift(a) + b; }

template <typename T, EnableIfLiteral<T> = 0>
inline Number operator-(const Number& a, T b) { return a - a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number operator-(T a, const Number& b) { return b.lift(a) - b; }

template <typename T, EnableIfLiteral<T> = 0>
inline Number operator*(const Number& a, T b) { return a * a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number operator*(T a, const Number& b) { return b.lift(a) * b; }

template <typename T, EnableIfLiteral<T> = 0>
inline Number operator/(const Number& a, T b) { return a / a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number operator/(T a, const Number& b) { return b.lift(a) / b; }

template <typename T, EnableIfLiteral<T> = 0>
inline Number& operator+=(Number& a, T b) { return a += a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number& operator-=(Number& a, T b) { return a -= a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number& operator*=(Number& a, T b) { return a *= a.lift(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline Number& operator/=(Number& a, T b) { return a /= a.lift(b); }

// Comparisons: Number with Number, or with a literal on the right. A literal
// on the left swaps sides and negates the comparison result.
template <typename R>
inline int compare(const Number& a, const R& b) { return a.compare(b); }
template <typename T, EnableIfLiteral<T> = 0>
inline int compare(T a, const Number& b) { return -b.compare(a); }

template <typename L, typename R>
using EnableIfComparable = std::enable_if_t<
    (std::is_same_v<L, Number> && (std::is_same_v<R, Number> || std::is_arithmetic_v<R>))
        || (std::is_arithmetic_v<L> && std::is_same_v<R, Number>),
    int>;

template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator==(const L& a, const R& b) { return compare(a, b) == 0; }
template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator!=(const L& a, const R& b) { return compare(a, b) != 0; }
template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator<(const L& a, const R& b) { return compare(a, b) < 0; }
template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator<=(const L& a, const R& b) { return compare(a, b) <= 0; }
template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator>(const L& a, const R& b) { return compare(a, b) > 0; }
template <typename L, typename R, EnableIfComparable<L, R> = 0>
inline bool operator>=(const L& a, const R& b) { return compare(a, b) >= 0; }

// Mathematical functions for fixed-point
inline Number abs(const Number& x) { return x.abs(); }
inline Number sqrt(const Number& x) { return x.sqrt(); }
inline Number exp(const Number& x) { return x.exp(); }
inline Number log(const Number& x) { return x.log(); }
inline Number atan(const Number& x) { return x.atan(); }
inline Number sin(const Number& x) { return x.sin(); }
inline Number cos(const Number& x) { return x.cos(); }
inline Number tan(const Number& x) { return x.tan(); }
inline Number asin(const Number& x) { return x.asin(); }
inline Number acos(const Number& x) { return x.acos(); }
inline Number pow(const Number& x, long long exponent) { return x.pow(exponent); }
inline Number pow(const Number& x, const Number& exponent) { return x.pow(exponent); }

} // namespace fxnum
