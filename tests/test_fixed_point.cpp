/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#undef NDEBUG
#include "fxnum/number.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace fxnum;

static constexpr double kPi = 3.14159265358979323846;

void test_fixed_point_construction() {
    std::cout << "Testing fixed-point construction..." << std::endl;

    auto fam = Family::create(15);

    // Test from_scaled
    Number a = Number::from_scaled(ScaledInteger::from_raw(32768), fam);
    assert(a == 1);

    // Test from double
    Number b(0.5, fam);
    assert(std::abs(b.to_double() - 0.5) < 0.001);

    // Test from integer
    Number c(5, fam);
    assert(c.to_int() == 5);

    // Test from text
    Number d("-2.25", fam);
    assert(d.to_double() == -2.25);

    std::cout << "  ✓ Construction tests passed" << std::endl;
}

void test_fixed_point_arithmetic() {
    std::cout << "Testing fixed-point arithmetic..." << std::endl;

    auto fam = Family::create(15);
    Number a(2.0, fam);
    Number b(3.0, fam);

    assert((a + b).to_double() == 5.0);
    assert((b - a).to_double() == 1.0);
    assert((a * b).to_double() == 6.0);
    assert(std::abs((b / a).to_double() - 1.5) < 0.001);
    assert((-a).to_double() == -2.0);

    std::cout << "  ✓ Arithmetic tests passed" << std::endl;
}

void test_fixed_point_math() {
    std::cout << "Testing fixed-point math functions..." << std::endl;

    auto fam = Family::create(32);
    assert(std::abs(sqrt(Number(2, fam)).to_double() - std::sqrt(2.0)) < 1e-9);
    assert(std::abs(exp(Number(1, fam)).to_double() - std::exp(1.0)) < 1e-8);
    assert(std::abs(log(Number(10, fam)).to_double() - std::log(10.0)) < 1e-8);
    assert(std::abs((4 * atan(Number(1, fam))).to_double() - kPi) < 1e-8);
    assert(std::abs(fam->pi().to_double() - kPi) < 1e-9);

    std::cout << "  ✓ Math tests passed" << std::endl;
}

void test_fixed_point_determinism() {
    std::cout << "Testing fixed-point determinism..." << std::endl;

    // Same operations in equal families give the same raw values
    Number a1(0.123456, Family::create(40));
    Number a2(0.123456, Family::create(40));
    assert(a1.scaled() == a2.scaled());

    Number r1 = a1.exp() * a1.sin();
    Number r2 = a2.exp() * a2.sin();
    assert(r1.scaled() == r2.scaled());

    std::cout << "  ✓ Determinism tests passed" << std::endl;
}

void test_fixed_point_range() {
    std::cout << "Testing fixed-point range..." << std::endl;

    auto fam = Family::create(15, 12);
    Number large(2000.0, fam);
    assert(large.to_double() == 2000.0);

    bool overflowed = false;
    try {
        Number too_large = large * 2;
        (void)too_large;
    } catch (const OverflowError&) {
        overflowed = true;
    }
    assert(overflowed);

    bool mismatched = false;
    try {
        Number sum = large + Number(1, Family::create(16, 12));
        (void)sum;
    } catch (const FamilyMismatch&) {
        mismatched = true;
    }
    assert(mismatched);

    std::cout << "  ✓ Range tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Fixed-Point Arithmetic Tests ===" << std::endl;

    try {
        test_fixed_point_construction();
        test_fixed_point_arithmetic();
        test_fixed_point_math();
        test_fixed_point_determinism();
        test_fixed_point_range();

        std::cout << "\n✅ All fixed-point tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
