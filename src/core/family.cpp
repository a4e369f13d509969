/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "fxnum/family.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "fxnum/errors.hpp"
#include "fxnum/math/solvers.hpp"
#include "fxnum/number.hpp"

namespace fxnum {

const char* constant_name(Constant which) {
    switch (which) {
        case Constant::Pi: return "pi";
        case Constant::Exp1: return "exp1";
        case Constant::Log2: return "log2";
    }
    return "unknown";
}

namespace {

ScaledInteger compute_constant(Constant which, unsigned w) {
    switch (which) {
        case Constant::Pi: return math::pi(w);
        case Constant::Exp1: return math::e(w);
        case Constant::Log2: return math::ln2(w);
    }
    throw std::invalid_argument("unknown family constant");
}

} // namespace

FamilyPtr Family::create(unsigned resolution, unsigned integer_bits) {
    if (resolution == 0) {
        throw std::invalid_argument("Family: resolution must be positive");
    }
    if (integer_bits == 0) {
        throw std::invalid_argument("Family: integer_bits must be positive");
    }
    return FamilyPtr(new Family(resolution, integer_bits));
}

Family::Family(unsigned resolution, unsigned integer_bits)
    : resolution_(resolution)
    , integer_bits_(integer_bits) {}

const Family::ConstantSlot& Family::slot(Constant which) const {
    ConstantSlot& s = constants_[static_cast<std::size_t>(which)];
    std::call_once(s.once, [&] {
        ScaledInteger guarded = compute_constant(which, constant_resolution());
        s.rounded = guarded.truncated(constant_resolution() - resolution_);
        s.guarded = std::move(guarded);
        s.evaluations.fetch_add(1);
    });
    return s;
}

Number Family::constant(Constant which) const {
    const ConstantSlot& s = slot(which);
    return Number::from_scaled(s.rounded, shared_from_this());
}

Number Family::constant(std::string_view name) const {
    if (name == "pi") return constant(Constant::Pi);
    if (name == "exp1" || name == "e") return constant(Constant::Exp1);
    if (name == "log2" || name == "ln2") return constant(Constant::Log2);
    throw std::invalid_argument(fmt::format("unknown family constant '{}'", name));
}

Number Family::pi() const { return constant(Constant::Pi); }
Number Family::exp1() const { return constant(Constant::Exp1); }
Number Family::log2() const { return constant(Constant::Log2); }

ScaledInteger Family::constant_raw(Constant which, unsigned working_resolution) const {
    if (working_resolution <= constant_resolution()) {
        return slot(which).guarded.rescaled(constant_resolution(), working_resolution);
    }
    return compute_constant(which, working_resolution);
}

unsigned Family::evaluations(Constant which) const {
    return constants_[static_cast<std::size_t>(which)].evaluations.load();
}

bool Family::in_range(const ScaledInteger& raw) const {
    return raw.bit_length() < static_cast<std::size_t>(resolution_) + integer_bits_;
}

void Family::check_range(const ScaledInteger& raw) const {
    if (in_range(raw)) return;
    const double magnitude = raw.to_double(resolution_);
    throw OverflowError(fmt::format("fixed-point overflow: {:.6g} does not fit {}", magnitude, describe()),
                        resolution_, integer_bits_, raw.bit_length(), magnitude);
}

ScaledInteger Family::max_magnitude() const {
    ScaledInteger::value_type limit = ScaledInteger::value_type(1) << (resolution_ + integer_bits_ - 1);
    return ScaledInteger(ScaledInteger::value_type(limit - 1));
}

Number Family::ulp() const {
    return Number::from_scaled(ScaledInteger(ScaledInteger::value_type(1)), shared_from_this());
}

std::string Family::describe() const {
    return fmt::format("Family(resolution={}, integer_bits={})", resolution_, integer_bits_);
}

} // namespace fxnum
