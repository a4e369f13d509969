/*
 * Unit tests for fxdemo command line parsing and layering
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <fxnum/cli/args.hpp>

using fxnum::logging::MemoryLogger;

namespace {

// argv storage that outlives the parse call
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "fxdemo");
        for (auto& s : storage) pointers.push_back(s.data());
        pointers.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

fxnum::config::ParseResult run(std::vector<std::string> args, MemoryLogger& log) {
    Argv a(std::move(args));
    return fxnum::cli::parse(a.argc(), a.argv(), log);
}

} // namespace

TEST_SUITE("CLI") {
    TEST_CASE("no arguments selects every demo") {
        MemoryLogger log;
        auto pr = run({"--config", "/nonexistent/fxdemo.conf"}, log);
        REQUIRE(pr.cfg.has_value());
        CHECK(pr.cfg->demos.empty());
        CHECK_FALSE(pr.show_only);
        CHECK(log.lines().empty());
    }

    TEST_CASE("positional demos") {
        MemoryLogger log;
        auto pr = run({"--config", "/nonexistent/fxdemo.conf", "basic", "speed"}, log);
        REQUIRE(pr.cfg.has_value());
        CHECK(pr.cfg->demos == std::vector<std::string>{"basic", "speed"});
    }

    TEST_CASE("--all wins over demo names") {
        MemoryLogger log;
        auto pr = run({"--config", "/nonexistent/fxdemo.conf", "-a", "basic"}, log);
        REQUIRE(pr.cfg.has_value());
        CHECK(pr.all);
        CHECK(pr.cfg->demos.empty());
    }

    TEST_CASE("unknown demo is a usage error") {
        MemoryLogger log;
        auto pr = run({"--config", "/nonexistent/fxdemo.conf", "bogus"}, log);
        CHECK_FALSE(pr.cfg.has_value());
        CHECK_FALSE(pr.show_only);
        CHECK(log.contains("unknown demo 'bogus'"));
        REQUIRE_FALSE(log.lines().empty());
        CHECK(log.lines().front().first == fxnum::logging::Level::Error);
    }

    TEST_CASE("unknown option is an argument error") {
        MemoryLogger log;
        auto pr = run({"--frobnicate"}, log);
        CHECK_FALSE(pr.cfg.has_value());
        CHECK_FALSE(pr.show_only);
        CHECK(log.contains("Argument error"));
    }

    TEST_CASE("--help and --version only print") {
        MemoryLogger help_log;
        auto help = run({"--help"}, help_log);
        CHECK(help.show_only);
        CHECK_FALSE(help.cfg.has_value());
        CHECK(help_log.contains("--config"));

        MemoryLogger version_log;
        auto version = run({"-v"}, version_log);
        CHECK(version.show_only);
        CHECK(version_log.contains("fxdemo v"));
    }

    TEST_CASE("--debug is OR'ed into the config") {
        MemoryLogger log;
        auto pr = run({"--config", "/nonexistent/fxdemo.conf", "-d"}, log);
        REQUIRE(pr.cfg.has_value());
        CHECK(pr.debug);
        CHECK(pr.cfg->debug);
    }

    TEST_CASE("config file values and command line demos layer") {
        const std::string path = "fxdemo_cli_test.conf";
        {
            std::ofstream out(path);
            out << "demos = overflow\nspeed_iterations = 7\n";
        }

        MemoryLogger log;
        auto from_file = run({"--config", path}, log);
        REQUIRE(from_file.cfg.has_value());
        CHECK(from_file.cfg->demos == std::vector<std::string>{"overflow"});
        CHECK(from_file.cfg->speed_iterations == 7);

        auto overridden = run({"--config", path, "piplot"}, log);
        REQUIRE(overridden.cfg.has_value());
        CHECK(overridden.cfg->demos == std::vector<std::string>{"piplot"});
        CHECK(overridden.cfg->speed_iterations == 7);

        std::remove(path.c_str());
    }

    TEST_CASE("bad config file is reported with its path") {
        const std::string path = "fxdemo_cli_bad.conf";
        {
            std::ofstream out(path);
            out << "speed_iterations = lots\n";
        }

        MemoryLogger log;
        auto pr = run({"--config", path}, log);
        CHECK_FALSE(pr.cfg.has_value());
        CHECK(log.contains(path));
        CHECK(log.contains("speed_iterations"));

        std::remove(path.c_str());
    }
}
