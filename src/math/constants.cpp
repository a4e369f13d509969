/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/math/solvers.hpp"

namespace fxnum::math {

using value_type = ScaledInteger::value_type;

namespace {

// Series below accumulate one rounding per term; a few bits per doubling of
// w keep the total under one unit at the requested resolution.
unsigned widened(unsigned w) {
    unsigned extra = 8;
    for (unsigned v = w; v > 0; v >>= 1) ++extra;
    return w + extra;
}

} // namespace

ScaledInteger atan_inverse(unsigned n, unsigned w) {
    const value_type n2 = value_type(n) * n;
    ScaledInteger power = ScaledInteger::one(w).divided_by(n);
    ScaledInteger sum = power;
    bool subtract = true;
    for (unsigned k = 3;; k += 2) {
        power = power.divided_by(n2);
        const ScaledInteger term = power.divided_by(k);
        if (term.is_zero()) break;
        if (subtract) sum -= term;
        else sum += term;
        subtract = !subtract;
    }
    return sum;
}

ScaledInteger atanh_inverse(unsigned n, unsigned w) {
    const value_type n2 = value_type(n) * n;
    ScaledInteger power = ScaledInteger::one(w).divided_by(n);
    ScaledInteger sum = power;
    for (unsigned k = 3;; k += 2) {
        power = power.divided_by(n2);
        const ScaledInteger term = power.divided_by(k);
        if (term.is_zero()) break;
        sum += term;
    }
    return sum;
}

ScaledInteger pi(unsigned w) {
    // Machin: pi = 16 atan(1/5) - 4 atan(1/239)
    const unsigned wide = widened(w);
    const ScaledInteger value = atan_inverse(5, wide).scaled_by(16) - atan_inverse(239, wide).scaled_by(4);
    return value.rescaled(wide, w);
}

ScaledInteger e(unsigned w) {
    const unsigned wide = widened(w);
    ScaledInteger sum = ScaledInteger::one(wide);
    ScaledInteger term = sum;
    for (unsigned k = 1;; ++k) {
        term = term.divided_by(k);
        if (term.is_zero()) break;
        sum += term;
    }
    return sum.rescaled(wide, w);
}

ScaledInteger ln2(unsigned w) {
    // ln 2 = 2 atanh(1/3)
    const unsigned wide = widened(w);
    return atanh_inverse(3, wide).shifted(1).rescaled(wide, w);
}

} // namespace fxnum::math
