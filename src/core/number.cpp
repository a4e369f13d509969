/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/number.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace fxnum {

using value_type = ScaledInteger::value_type;

namespace {

// Largest decimal exponent accepted in text, keeps 10^e within reason
constexpr long kMaxDecimalExponent = 100000;

ScaledInteger parse_decimal(std::string_view text, unsigned resolution) {
    auto fail = [&](const char* why) {
        return ParseError(fmt::format("invalid number '{}': {}", text, why));
    };

    std::size_t pos = 0;
    const std::size_t size = text.size();
    while (pos < size && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

    bool negative = false;
    if (pos < size && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    value_type digits = 0;
    long exponent10 = 0;
    bool any_digit = false;
    while (pos < size && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        digits = digits * 10 + (text[pos] - '0');
        any_digit = true;
        ++pos;
    }
    if (pos < size && text[pos] == '.') {
        ++pos;
        while (pos < size && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            digits = digits * 10 + (text[pos] - '0');
            --exponent10;
            any_digit = true;
            ++pos;
        }
    }
    if (!any_digit) throw fail("no digits");

    if (pos < size && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exp_negative = false;
        if (pos < size && (text[pos] == '+' || text[pos] == '-')) {
            exp_negative = text[pos] == '-';
            ++pos;
        }
        long exponent = 0;
        bool exp_digit = false;
        while (pos < size && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (exponent > kMaxDecimalExponent) throw fail("exponent out of range");
            exp_digit = true;
            ++pos;
        }
        if (!exp_digit) throw fail("missing exponent digits");
        exponent10 += exp_negative ? -exponent : exponent;
    }

    while (pos < size && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos != size) throw fail("trailing characters");

    value_type scaled;
    if (exponent10 >= 0) {
        value_type power = boost::multiprecision::pow(value_type(10), static_cast<unsigned>(exponent10));
        scaled = value_type(digits * power) << resolution;
    } else {
        value_type power = boost::multiprecision::pow(value_type(10), static_cast<unsigned>(-exponent10));
        scaled = rounded_quotient(value_type(digits << resolution), power);
    }
    return ScaledInteger(negative ? value_type(-scaled) : scaled);
}

} // namespace

unsigned Number::resolution_of(const FamilyPtr& family) {
    if (!family) {
        throw std::invalid_argument("Number requires a family");
    }
    return family->resolution();
}

Number::Number(ScaledInteger scaled, FamilyPtr family)
    : scaled_(std::move(scaled))
    , family_(std::move(family)) {
    if (!family_) {
        throw std::invalid_argument("Number requires a family");
    }
    family_->check_range(scaled_);
}

Number::Number(std::string_view text, FamilyPtr family)
    : Number(parse_decimal(text, resolution_of(family)), family) {}

Number::Number(const Number& other, FamilyPtr family)
    : Number(other.scaled_.rescaled(other.resolution(), resolution_of(family)), family) {}

void Number::require_same_family(const Number& other, const char* operation) const {
    if (family_ == other.family_ || *family_ == *other.family_) return;
    throw FamilyMismatch(fmt::format("operator{} between {} and {}", operation,
                                     family_->describe(), other.family_->describe()));
}

long long Number::to_int() const {
    const value_type whole = scaled_.integer_part(resolution());
    if (whole > std::numeric_limits<long long>::max() || whole < std::numeric_limits<long long>::min()) {
        throw OverflowError(fmt::format("{} does not fit a 64-bit integer", to_decimal_string(0)),
                            resolution(), family_->integer_bits(), scaled_.bit_length(), to_double());
    }
    return whole.convert_to<long long>();
}

std::string Number::to_decimal_string(int digits) const {
    const unsigned res = resolution();
    const int places = digits >= 0 ? digits : static_cast<int>(std::ceil(res * std::log10(2.0)));

    const value_type scale = boost::multiprecision::pow(value_type(10), static_cast<unsigned>(places));
    const value_type magnitude = boost::multiprecision::abs(scaled_.raw());
    const value_type fixed = rounded_quotient(value_type(magnitude * scale), value_type(value_type(1) << res));
    const value_type whole = fixed / scale;
    const value_type fraction = fixed % scale;

    std::string out;
    if (scaled_.is_negative() && !fixed.is_zero()) out += '-';
    out += whole.str();
    if (places > 0) {
        const std::string frac = fraction.str();
        out += '.';
        out.append(static_cast<std::size_t>(places) - frac.size(), '0');
        out += frac;
    }
    return out;
}

Number Number::operator+(const Number& other) const {
    require_same_family(other, "+");
    return Number(scaled_ + other.scaled_, family_);
}

Number Number::operator-(const Number& other) const {
    require_same_family(other, "-");
    return Number(scaled_ - other.scaled_, family_);
}

Number Number::operator*(const Number& other) const {
    require_same_family(other, "*");
    return Number(ScaledInteger::multiply(scaled_, other.scaled_, resolution()), family_);
}

Number Number::operator/(const Number& other) const {
    require_same_family(other, "/");
    return Number(ScaledInteger::divide(scaled_, other.scaled_, resolution()), family_);
}

Number Number::operator-() const {
    return Number(-scaled_, family_);
}

int Number::compare(const Number& other) const {
    require_same_family(other, "<=>");
    if (scaled_ < other.scaled_) return -1;
    return scaled_ == other.scaled_ ? 0 : 1;
}

Number Number::abs() const {
    return is_negative() ? -*this : *this;
}

} // namespace fxnum
