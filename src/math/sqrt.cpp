/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/math/solvers.hpp"

#include "fxnum/errors.hpp"

namespace fxnum::math {

using value_type = ScaledInteger::value_type;

value_type isqrt(const value_type& n) {
    if (n.sign() < 0) {
        throw DomainError("square root of a negative number");
    }
    if (n.is_zero()) return value_type(0);

    // Seed 2^ceil(bits/2) is never below sqrt(n); Newton then descends
    // monotonically onto floor(sqrt(n)) and stops decreasing there.
    const unsigned bits = boost::multiprecision::msb(n) + 1;
    value_type x = value_type(1) << ((bits + 1) / 2);
    while (true) {
        value_type y = (x + n / x) >> 1;
        if (y >= x) break;
        x = std::move(y);
    }
    return x;
}

ScaledInteger sqrt(const ScaledInteger& x, unsigned w) {
    if (x.is_negative()) {
        throw DomainError("square root of a negative number");
    }
    // sqrt(X / 2^w) * 2^w == sqrt(X * 2^w)
    value_type n = x.raw() << w;
    value_type root = isqrt(n);
    value_type remainder = n - root * root;
    // round to nearest: sqrt(n) >= root + 1/2  <=>  n > root^2 + root
    if (remainder > root) ++root;
    return ScaledInteger(std::move(root));
}

} // namespace fxnum::math
