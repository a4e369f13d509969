/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/math/solvers.hpp"

namespace fxnum::math {

using value_type = ScaledInteger::value_type;

std::pair<ScaledInteger, ScaledInteger> sin_cos(const ScaledInteger& x, unsigned w, const ScaledInteger& pi) {
    // x = y + q * pi/2 with |y| <= pi/4
    const value_type q = rounded_quotient(value_type(x.raw() * 2), pi.raw());
    const ScaledInteger y = (x.scaled_by(2) - pi.scaled_by(q)).shifted(-1);
    const ScaledInteger y2 = ScaledInteger::multiply(y, y, w);

    ScaledInteger s = y;
    ScaledInteger term = y;
    for (unsigned n = 1;; ++n) {
        const value_type divisor = value_type(2 * n) * (2 * n + 1);
        term = (-ScaledInteger::multiply(term, y2, w)).divided_by(divisor);
        if (term.is_zero()) break;
        s += term;
    }

    const ScaledInteger one = ScaledInteger::one(w);
    ScaledInteger c = one;
    term = one;
    for (unsigned n = 1;; ++n) {
        const value_type divisor = value_type(2 * n - 1) * (2 * n);
        term = (-ScaledInteger::multiply(term, y2, w)).divided_by(divisor);
        if (term.is_zero()) break;
        c += term;
    }

    value_type quadrant_raw = q % 4;
    if (quadrant_raw.sign() < 0) quadrant_raw += 4;
    switch (quadrant_raw.convert_to<int>()) {
        case 1: return {c, -s};
        case 2: return {-s, -c};
        case 3: return {-c, s};
        default: return {s, c};
    }
}

} // namespace fxnum::math
