/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "fxnum/scaled_integer.hpp"

namespace fxnum {

class Number;
class Family;

using FamilyPtr = std::shared_ptr<const Family>;

// Family-wide constants, each computed at most once per family
enum class Constant {
    Pi,
    Exp1,
    Log2
};

const char* constant_name(Constant which);

/**
 * Precision configuration shared by every Number created under it.
 *
 * - resolution: number of fractional bits
 * - integer_bits: magnitude bound, |value| < 2^(integer_bits - 1)
 *
 * Families are immutable and always owned through a shared pointer (see
 * create()); two families with the same parameters compare equal and their
 * numbers interoperate. The only mutable state is the constant cache, whose
 * slots are each filled once under std::call_once.
 */
class Family : public std::enable_shared_from_this<Family> {
public:
    static constexpr unsigned kDefaultIntegerBits = 64;
    // Extra fractional bits used while computing constants and solver results
    static constexpr unsigned kGuardBits = 16;

    /**
     * @brief Create a family.
     * @throws std::invalid_argument if resolution or integer_bits is zero
     */
    static FamilyPtr create(unsigned resolution, unsigned integer_bits = kDefaultIntegerBits);

    Family(const Family&) = delete;
    Family& operator=(const Family&) = delete;

    unsigned resolution() const { return resolution_; }
    unsigned integer_bits() const { return integer_bits_; }
    unsigned guard_resolution() const { return resolution_ + kGuardBits; }

    // Resolution of the constant cache. Covers every working resolution the
    // solvers derive from this family: trig range reduction adds up to
    // integer_bits, real powers up to twice that.
    unsigned constant_resolution() const { return guard_resolution() + 2 * integer_bits_ + 4; }

    // Cached constants, rounded down to this family's resolution
    Number constant(Constant which) const;
    // "pi", "exp1" (or "e"), "log2" (or "ln2"); throws std::invalid_argument otherwise
    Number constant(std::string_view name) const;
    Number pi() const;
    Number exp1() const;
    Number log2() const;

    /**
     * @brief Constant scaled by 2^working_resolution for use inside solvers.
     *
     * Served from the cache when working_resolution <= constant_resolution(),
     * otherwise computed on the spot without touching the cache.
     */
    ScaledInteger constant_raw(Constant which, unsigned working_resolution) const;

    // How many times the constant has been computed for this family (0 or 1)
    unsigned evaluations(Constant which) const;

    // Overflow guard: throws OverflowError when |raw| >= 2^(resolution + integer_bits - 1)
    void check_range(const ScaledInteger& raw) const;
    bool in_range(const ScaledInteger& raw) const;

    // Largest representable scaled magnitude
    ScaledInteger max_magnitude() const;

    // One unit in the last place, 2^-resolution
    Number ulp() const;

    std::string describe() const;

    bool operator==(const Family& other) const {
        return resolution_ == other.resolution_ && integer_bits_ == other.integer_bits_;
    }
    bool operator!=(const Family& other) const { return !(*this == other); }

private:
    Family(unsigned resolution, unsigned integer_bits);

    struct ConstantSlot {
        std::once_flag once;
        ScaledInteger guarded;   // at constant_resolution()
        ScaledInteger rounded;   // rounded down to resolution()
        std::atomic<unsigned> evaluations{0};
    };

    const ConstantSlot& slot(Constant which) const;

    unsigned resolution_;
    unsigned integer_bits_;
    mutable std::array<ConstantSlot, 3> constants_;
};

} // namespace fxnum
