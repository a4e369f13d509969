/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fxnum {

/**
 * @brief Base class of every failure raised by the fixed-point engine.
 */
class FixedPointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A result does not fit the integer range of its family.
 *
 * Carries the offending family parameters and the magnitude that did not fit,
 * so callers demonstrating range limits can report where it happened.
 */
class OverflowError : public FixedPointError {
public:
    OverflowError(const std::string& what, unsigned resolution, unsigned integer_bits,
                  std::size_t magnitude_bits, double magnitude)
        : FixedPointError(what)
        , resolution_(resolution)
        , integer_bits_(integer_bits)
        , magnitude_bits_(magnitude_bits)
        , magnitude_(magnitude) {}

    unsigned resolution() const { return resolution_; }
    unsigned integer_bits() const { return integer_bits_; }
    // Bit length of the scaled magnitude that failed the range check
    std::size_t magnitude_bits() const { return magnitude_bits_; }
    // Approximate real magnitude (may be infinite for very wide values)
    double magnitude() const { return magnitude_; }

private:
    unsigned resolution_;
    unsigned integer_bits_;
    std::size_t magnitude_bits_;
    double magnitude_;
};

// Operation undefined for its input (sqrt(-1), log(0), asin(2), NaN)
class DomainError : public FixedPointError {
public:
    using FixedPointError::FixedPointError;
};

class DivisionByZero : public FixedPointError {
public:
    using FixedPointError::FixedPointError;
};

// Binary operation between numbers of unequal families
class FamilyMismatch : public FixedPointError {
public:
    using FixedPointError::FixedPointError;
};

// Malformed decimal text
class ParseError : public FixedPointError {
public:
    using FixedPointError::FixedPointError;
};

} // namespace fxnum
