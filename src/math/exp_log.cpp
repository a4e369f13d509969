/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/math/solvers.hpp"

#include "fxnum/errors.hpp"

namespace fxnum::math {

ScaledInteger exp_positive(const ScaledInteger& x, unsigned w) {
    const ScaledInteger one = ScaledInteger::one(w);
    if (x.is_zero()) return one;

    // exp(x) = exp(x / 2^k)^(2^k) with x / 2^k < 1/2
    const std::size_t bits = x.bit_length();
    const unsigned halvings = bits + 1 > w ? static_cast<unsigned>(bits + 1 - w) : 0u;
    const ScaledInteger y = x.shifted(-static_cast<int>(halvings));

    ScaledInteger sum = one;
    ScaledInteger term = one;
    for (unsigned n = 1;; ++n) {
        term = ScaledInteger::multiply(term, y, w).divided_by(n);
        if (term.is_zero()) break;
        sum += term;
    }

    for (unsigned k = 0; k < halvings; ++k) {
        sum = ScaledInteger::multiply(sum, sum, w);
    }
    return sum;
}

ScaledInteger exp(const ScaledInteger& x, unsigned w) {
    if (!x.is_negative()) return exp_positive(x, w);
    const ScaledInteger denominator = exp_positive(-x, w);
    return ScaledInteger::divide(ScaledInteger::one(w), denominator, w);
}

ScaledInteger log(const ScaledInteger& x, unsigned w, const ScaledInteger& ln2) {
    if (x.sign() <= 0) {
        throw DomainError("logarithm of a non-positive number");
    }

    // x = m * 2^n with m in [1, 2)
    long n = static_cast<long>(x.bit_length()) - 1 - static_cast<long>(w);
    ScaledInteger m = x.shifted(static_cast<int>(-n));

    // Centre the mantissa on 1: m in [3/4, 3/2)
    const ScaledInteger one = ScaledInteger::one(w);
    const ScaledInteger three_halves = one.scaled_by(3).shifted(-1);
    if (m >= three_halves) {
        m = m.shifted(-1);
        ++n;
    }

    // ln(m) = 2 atanh(z), z = (m - 1) / (m + 1), |z| < 1/5
    const ScaledInteger z = ScaledInteger::divide(m - one, m + one, w);
    const ScaledInteger z2 = ScaledInteger::multiply(z, z, w);
    ScaledInteger sum;
    ScaledInteger power = z;
    for (unsigned k = 1;; k += 2) {
        const ScaledInteger term = power.divided_by(k);
        if (term.is_zero()) break;
        sum += term;
        power = ScaledInteger::multiply(power, z2, w);
    }

    return sum.shifted(1) + ln2.scaled_by(n);
}

} // namespace fxnum::math
