/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <utility>

#include "fxnum/scaled_integer.hpp"

// Stateless transcendental kernels.
//
// Every function takes values scaled by 2^w (the working resolution) and
// returns a value scaled by 2^w. Series stop as soon as the next term is zero
// at that resolution, so the cost grows with w rather than a fixed iteration
// count. Range checks and rounding back to a family resolution are the
// caller's business (see number_math.cpp).
namespace fxnum::math {

// Integer square root floor(sqrt(n)) by Newton iteration, n >= 0
ScaledInteger::value_type isqrt(const ScaledInteger::value_type& n);

// sqrt(x), rounded to nearest. Throws DomainError for x < 0.
ScaledInteger sqrt(const ScaledInteger& x, unsigned w);

// exp(x) for x >= 0 by halving, Taylor series and repeated squaring
ScaledInteger exp_positive(const ScaledInteger& x, unsigned w);

// exp(x) for any sign; negative arguments go through 1 / exp(|x|)
ScaledInteger exp(const ScaledInteger& x, unsigned w);

// ln(x) for x > 0, ln2 must be scaled by 2^w. Throws DomainError otherwise.
ScaledInteger log(const ScaledInteger& x, unsigned w, const ScaledInteger& ln2);

// atan(x) with half-angle reduction
ScaledInteger atan(const ScaledInteger& x, unsigned w);

// sin and cos of x; pi must be scaled by 2^w
std::pair<ScaledInteger, ScaledInteger> sin_cos(const ScaledInteger& x, unsigned w, const ScaledInteger& pi);

// Constants
ScaledInteger pi(unsigned w);
ScaledInteger e(unsigned w);
ScaledInteger ln2(unsigned w);

// atan(1/n) and atanh(1/n) for integer n >= 2
ScaledInteger atan_inverse(unsigned n, unsigned w);
ScaledInteger atanh_inverse(unsigned n, unsigned w);

} // namespace fxnum::math
