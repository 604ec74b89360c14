// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <courier/core/config.hpp>
#include <courier/core/logging.hpp>
#include <courier/core/prefs.hpp>
#include <filesystem>
#include <fstream>

using namespace courier::core;
using namespace std::chrono_literals;

TEST_CASE("Prefs defaults", "[prefs]") {
    Prefs prefs;
    CHECK(prefs.conflict_action == "uniquify");
    CHECK(prefs.concurrent_downloads == CONCURRENT_DOWNLOADS);
    CHECK(prefs.flush_interval == FLUSH_INTERVAL);
    CHECK(prefs.erase_grace == ERASE_GRACE_DELAY);
    CHECK(prefs.database == "courier.db");
    CHECK(prefs.log_level == "info");
}

TEST_CASE("Prefs::parse", "[prefs]") {
    SECTION("Known keys override defaults") {
        auto prefs = Prefs::parse(R"({
            "conflictAction": "overwrite",
            "concurrentDownloads": 5,
            "flushIntervalMs": 250,
            "eraseGraceMs": 2000,
            "database": "/var/lib/courier/queue.db",
            "logLevel": "debug"
        })");
        REQUIRE(prefs.has_value());
        CHECK(prefs->conflict_action == "overwrite");
        CHECK(prefs->concurrent_downloads == 5);
        CHECK(prefs->flush_interval == 250ms);
        CHECK(prefs->erase_grace == 2000ms);
        CHECK(prefs->database == "/var/lib/courier/queue.db");
        CHECK(prefs->log_level == "debug");
    }

    SECTION("Missing and unknown keys keep defaults") {
        auto prefs = Prefs::parse(R"({"somethingElse": true})");
        REQUIRE(prefs.has_value());
        CHECK(prefs->conflict_action == "uniquify");
        CHECK(prefs->erase_grace == ERASE_GRACE_DELAY);
    }

    SECTION("Out of range values are clamped") {
        auto prefs = Prefs::parse(R"({"concurrentDownloads": 0, "eraseGraceMs": -5})");
        REQUIRE(prefs.has_value());
        CHECK(prefs->concurrent_downloads == 1);
        CHECK(prefs->erase_grace == 0ms);
    }

    SECTION("Malformed input") {
        CHECK(Prefs::parse("{not json").error() == std::errc::invalid_argument);
        CHECK(Prefs::parse("[1, 2]").error() == std::errc::invalid_argument);
        CHECK(Prefs::parse(R"({"concurrentDownloads": "many"})").error() == std::errc::invalid_argument);
    }
}

TEST_CASE("Prefs save and load", "[prefs]") {
    auto dir = std::filesystem::temp_directory_path() / "courier_prefs_tests";
    std::filesystem::remove_all(dir);
    auto path = (dir / "nested" / "prefs.json").string();

    SECTION("Round trip through a file") {
        Prefs prefs;
        prefs.conflict_action = "overwrite";
        prefs.concurrent_downloads = 2;
        prefs.erase_grace = 10ms;
        REQUIRE_FALSE(prefs.save(path));

        auto loaded = Prefs::load(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->conflict_action == "overwrite");
        CHECK(loaded->concurrent_downloads == 2);
        CHECK(loaded->erase_grace == 10ms);
    }

    SECTION("Missing file") {
        auto loaded = Prefs::load((dir / "absent.json").string());
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == std::errc::no_such_file_or_directory);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Log level names", "[logging]") {
    CHECK(parse_level("debug") == spdlog::level::debug);
    CHECK(parse_level("warn") == spdlog::level::warn);
    CHECK(parse_level("off") == spdlog::level::off);
    CHECK(logger()->name() == LOGGER_NAME);
}
