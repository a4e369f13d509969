/*
 * Unit tests for the demo computations (overflow points, pi series, lost bits)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>

#include <fxnum/demo/demos.hpp>
#include <fxnum/family.hpp>

using namespace fxnum;

TEST_SUITE("Demos") {
    TEST_CASE("overflow point grows with integer width") {
        const auto points = demo::find_overflow_points(20, {4, 8, 16, 32}, 0.1);
        REQUIRE(points.size() == 4);

        // exp(x) must stay below 2^(integer_bits - 1): x < (integer_bits - 1) ln 2
        CHECK(points[0].integer_bits == 4);
        CHECK(points[0].x == doctest::Approx(2.1).epsilon(0.01));
        CHECK(points[3].x == doctest::Approx(21.5).epsilon(0.01));
        for (std::size_t i = 1; i < points.size(); ++i) {
            CHECK(points[i - 1].x < points[i].x);
        }
        for (const auto& p : points) {
            CHECK(p.x >= (p.integer_bits - 1) * std::log(2.0));
        }
    }

    TEST_CASE("overflow step must survive rounding into the family") {
        // 1e-7 is below half a unit at 20 fractional bits
        CHECK_THROWS_AS(demo::find_overflow_points(20, {4}, 1e-7), std::invalid_argument);
        CHECK_THROWS_AS(demo::find_overflow_points(20, {4}, -0.1), std::invalid_argument);
        CHECK_THROWS_AS(demo::find_overflow_points(20, {4}, 0.0), std::invalid_argument);

        // One unit is the smallest usable step: |x| < 4 means exp(x) fails from x = 23/16
        const auto points = demo::find_overflow_points(4, {3}, 1.0 / 16);
        REQUIRE(points.size() == 1);
        CHECK(points.front().x == doctest::Approx(1.4375));
    }

    TEST_CASE("lost bits of the cached pi stay below one") {
        for (unsigned res : {16u, 64u, 200u}) {
            CAPTURE(res);
            auto fam = Family::create(res);
            const Number reference = Family::create(res + 40)->pi();
            CHECK(demo::lost_bits(fam->pi(), reference) < 1.0);
        }
    }

    TEST_CASE("lost bits of an exact value report the reference margin") {
        const Number one(1, Family::create(8));
        const Number reference(1, Family::create(48));
        CHECK(demo::lost_bits(one, reference) == doctest::Approx(-40.0));
    }

    TEST_CASE("pi convergence table") {
        const auto points = demo::pi_convergence(8, 12);
        REQUIRE(points.size() == 5);
        for (const auto& p : points) {
            CAPTURE(p.resolution);
            CHECK(std::fabs(p.error) <= std::ldexp(1.0, -static_cast<int>(p.resolution) + 2));
            CHECK(p.value.rfind("3.1", 0) == 0);
        }
    }

    TEST_CASE("pi accuracy table") {
        const auto points = demo::pi_accuracy(16, 64);
        REQUIRE(points.size() == 4);
        CHECK(points.front().resolution == 16);
        CHECK(points.back().resolution == 64);
        for (const auto& p : points) {
            CAPTURE(p.resolution);
            CHECK(p.atan_lost_bits <= 2.5);
            CHECK(p.family_lost_bits < 1.0);
        }
    }

    TEST_CASE("speed demo runs on small settings") {
        config::DemoConfig cfg;
        cfg.speed_iterations = 3;
        cfg.speed_resolutions = {16, 64};
        cfg.sqrt_resolutions = {8};

        logging::MemoryLogger log;
        CHECK_NOTHROW(demo::speed(cfg, log));
    }

    TEST_CASE("run dispatches by name") {
        config::DemoConfig cfg;
        cfg.demos = {"basic"};
        cfg.basic_resolutions = {8, 16};

        logging::MemoryLogger log;
        demo::run(cfg, log);
        CHECK(log.contains("running demo 'basic'"));

        cfg.demos = {"nope"};
        CHECK_THROWS_AS(demo::run(cfg, log), std::invalid_argument);
    }
}
