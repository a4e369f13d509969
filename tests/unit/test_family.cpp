/*
 * Unit tests for families: parameters, range guard and the constant cache
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include <fxnum/family.hpp>
#include <fxnum/number.hpp>

using namespace fxnum;

TEST_SUITE("Family") {
    TEST_CASE("create - rejects zero parameters") {
        CHECK_THROWS_AS(Family::create(0), std::invalid_argument);
        CHECK_THROWS_AS(Family::create(8, 0), std::invalid_argument);

        auto fam = Family::create(24);
        CHECK(fam->resolution() == 24);
        CHECK(fam->integer_bits() == Family::kDefaultIntegerBits);
        CHECK(fam->guard_resolution() == 24 + Family::kGuardBits);
    }

    TEST_CASE("equality is by parameters") {
        CHECK(*Family::create(16) == *Family::create(16));
        CHECK(*Family::create(16) != *Family::create(16, 8));
        CHECK(*Family::create(16) != *Family::create(17));
        CHECK(Family::create(16, 8)->describe() == "Family(resolution=16, integer_bits=8)");
    }

    TEST_CASE("pi is computed once and bit-identical") {
        auto fam = Family::create(64);
        CHECK(fam->evaluations(Constant::Pi) == 0);

        const Number first = fam->pi();
        const Number second = fam->pi();
        CHECK(first.scaled() == second.scaled());
        CHECK(fam->evaluations(Constant::Pi) == 1);
        CHECK(fam->evaluations(Constant::Exp1) == 0);
        CHECK(first.to_double() == doctest::Approx(3.141592653589793).epsilon(1e-15));
    }

    TEST_CASE("constants are rounded down to the resolution") {
        auto fam = Family::create(8);
        CHECK(fam->pi().scaled().raw() == 804);     // pi * 256 = 804.25
        CHECK(fam->exp1().scaled().raw() == 695);   // e * 256 = 695.89
        CHECK(fam->log2().scaled().raw() == 177);   // ln2 * 256 = 177.45
    }

    TEST_CASE("constants by name") {
        auto fam = Family::create(32);
        CHECK(fam->constant("pi") == fam->pi());
        CHECK(fam->constant("e") == fam->exp1());
        CHECK(fam->constant("exp1") == fam->exp1());
        CHECK(fam->constant("ln2") == fam->log2());
        CHECK_THROWS_AS(fam->constant("tau"), std::invalid_argument);
        CHECK(std::string(constant_name(Constant::Log2)) == "log2");
    }

    TEST_CASE("constants wider than the cache do not touch it") {
        auto fam = Family::create(8);
        const ScaledInteger wide = fam->constant_raw(Constant::Pi, 200);
        CHECK(fam->evaluations(Constant::Pi) == 0);
        CHECK(wide.to_double(200) == doctest::Approx(3.141592653589793).epsilon(1e-15));

        // 8 + 16 guard bits + 2 * 64 integer bits + 4
        CHECK(fam->constant_resolution() == 156);
        const ScaledInteger cached = fam->constant_raw(Constant::Pi, fam->constant_resolution());
        CHECK(fam->evaluations(Constant::Pi) == 1);
        CHECK(cached.rescaled(fam->constant_resolution(), 200).to_double(200) == doctest::Approx(wide.to_double(200)));
    }

    TEST_CASE("solvers reuse the cached constants") {
        auto fam = Family::create(2000);
        for (int i = 0; i < 20; ++i) {
            (void)Number(0.25, fam).acos();
        }
        CHECK(fam->evaluations(Constant::Pi) == 1);

        (void)Number(1, fam).asin();
        (void)Number(100, fam).sin();
        (void)Number(-7.5, fam).cos();
        (void)Number(3, fam).tan();
        CHECK(fam->evaluations(Constant::Pi) == 1);

        (void)Number(10, fam).log();
        (void)Number(2, fam).pow(Number(0.5, fam));
        CHECK(fam->evaluations(Constant::Log2) == 1);
    }

    TEST_CASE("concurrent first use computes once") {
        auto fam = Family::create(512);
        std::vector<std::thread> threads;
        std::vector<ScaledInteger> results(8);
        for (std::size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i] { results[i] = fam->pi().scaled(); });
        }
        for (auto& t : threads) t.join();

        CHECK(fam->evaluations(Constant::Pi) == 1);
        for (const auto& r : results) CHECK(r == results.front());
    }

    TEST_CASE("constant outside the integer range overflows") {
        // integer_bits = 2 admits |x| < 2
        auto fam = Family::create(8, 2);
        CHECK_THROWS_AS(fam->pi(), OverflowError);
        CHECK_THROWS_AS(fam->exp1(), OverflowError);
        CHECK(fam->log2().scaled().raw() == 177);
    }

    TEST_CASE("range guard") {
        auto fam = Family::create(8, 4);
        CHECK(fam->in_range(ScaledInteger::from_double(7.99, 8)));
        CHECK_FALSE(fam->in_range(ScaledInteger::from_integer(8, 8)));
        CHECK_FALSE(fam->in_range(ScaledInteger::from_integer(-8, 8)));
        CHECK(fam->in_range(fam->max_magnitude()));
        CHECK_FALSE(fam->in_range(fam->max_magnitude() + ScaledInteger(1)));

        try {
            fam->check_range(ScaledInteger::from_integer(100, 8));
            FAIL("expected OverflowError");
        } catch (const OverflowError& e) {
            CHECK(e.resolution() == 8);
            CHECK(e.integer_bits() == 4);
            CHECK(e.magnitude() == doctest::Approx(100.0));
            CHECK(std::string(e.what()).find("integer_bits=4") != std::string::npos);
        }
    }

    TEST_CASE("ulp is one scaled unit") {
        auto fam = Family::create(10);
        CHECK(fam->ulp().scaled().raw() == 1);
        CHECK(fam->ulp().to_double() == doctest::Approx(1.0 / 1024.0));
    }
}
