/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/math/solvers.hpp"

namespace fxnum::math {

ScaledInteger atan(const ScaledInteger& x, unsigned w) {
    if (x.is_zero()) return ScaledInteger();

    const bool negative = x.is_negative();
    const ScaledInteger one = ScaledInteger::one(w);
    const ScaledInteger threshold = one.shifted(-3);

    // atan(a) = 2 atan(a / (1 + sqrt(1 + a^2))) until a <= 1/8
    ScaledInteger a = x.abs();
    unsigned doublings = 0;
    while (a > threshold) {
        const ScaledInteger root = sqrt(one + ScaledInteger::multiply(a, a, w), w);
        a = ScaledInteger::divide(a, one + root, w);
        ++doublings;
    }

    // a - a^3/3 + a^5/5 - ...
    const ScaledInteger a2 = ScaledInteger::multiply(a, a, w);
    ScaledInteger sum;
    ScaledInteger power = a;
    bool subtract = false;
    for (unsigned k = 1;; k += 2) {
        const ScaledInteger term = power.divided_by(k);
        if (term.is_zero()) break;
        if (subtract) sum -= term;
        else sum += term;
        subtract = !subtract;
        power = ScaledInteger::multiply(power, a2, w);
    }

    sum = sum.shifted(static_cast<int>(doublings));
    return negative ? -sum : sum;
}

} // namespace fxnum::math
