// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/settings.hpp>
#include <surge/disk/error.hpp>
#include "fake_transport.hpp"
#include <fstream>

using namespace surge::core;
using namespace std::chrono_literals;

TEST_CASE("Settings::parse", "[settings]") {
    SECTION("All keys") {
        auto settings = Settings::parse(R"({
            "workers": 8,
            "min_chunk_size": 1048576,
            "max_chunk_retries": 5,
            "timeout_sec": 120,
            "user_agent": "surge-test",
            "referer": "https://example.org/files/",
            "download_attempts": 3,
            "retry_delay_sec": 4,
            "log_level": "debug"
        })");
        REQUIRE(settings.has_value());
        CHECK(settings->workers == 8u);
        CHECK(settings->min_chunk_size == 1048576u);
        CHECK(settings->max_chunk_retries == 5u);
        CHECK(settings->timeout == 120s);
        CHECK(settings->user_agent == "surge-test");
        CHECK(settings->referer == "https://example.org/files/");
        CHECK(settings->download_attempts == 3u);
        CHECK(settings->retry_delay == 4s);
        CHECK(settings->log_level == "debug");
    }

    SECTION("Empty object and unknown keys") {
        auto settings = Settings::parse(R"({"colour": "blue"})");
        REQUIRE(settings.has_value());
        CHECK(!settings->workers);
        CHECK(!settings->user_agent);
    }

    SECTION("Wrong type") {
        auto settings = Settings::parse(R"({"workers": "many"})");
        REQUIRE(!settings.has_value());
        CHECK(settings.error() == DownloadErrc::invalid_settings);
    }

    SECTION("Negative value") {
        CHECK(Settings::parse(R"({"download_attempts": -1})").error() == DownloadErrc::invalid_settings);
        CHECK(Settings::parse(R"({"max_chunk_retries": -3})").error() == DownloadErrc::invalid_settings);
        CHECK(Settings::parse(R"({"retry_delay_sec": -2})").error() == DownloadErrc::invalid_settings);
    }

    SECTION("Fractional value") {
        CHECK(Settings::parse(R"({"workers": 3.7})").error() == DownloadErrc::invalid_settings);
    }

    SECTION("Value out of range") {
        CHECK(Settings::parse(R"({"workers": 4294967296})").error() == DownloadErrc::invalid_settings);
        auto large = Settings::parse(R"({"min_chunk_size": 4294967296})");
        REQUIRE(large.has_value());
        CHECK(large->min_chunk_size == 4294967296u);
    }

    SECTION("Log level") {
        CHECK(Settings::parse(R"({"log_level": "warn"})").has_value());
        CHECK(Settings::parse(R"({"log_level": "off"})").has_value());
        CHECK(Settings::parse(R"({"log_level": "warnig"})").error() == DownloadErrc::invalid_settings);
        CHECK(Settings::parse(R"({"log_level": 3})").error() == DownloadErrc::invalid_settings);
    }

    SECTION("Syntax error") {
        CHECK(Settings::parse("{ workers: 4").error() == DownloadErrc::invalid_settings);
    }

    SECTION("Not an object") {
        CHECK(Settings::parse("[1, 2]").error() == DownloadErrc::invalid_settings);
    }
}

TEST_CASE("Settings::apply", "[settings]") {
    auto settings = Settings::parse(R"({"workers": 2, "timeout_sec": 5, "referer": "https://r/"})");
    REQUIRE(settings.has_value());

    DownloadRequest request;
    request.min_chunk_size = 1234;
    settings->apply(request);

    CHECK(request.worker_count == 2);
    CHECK(request.attempt_timeout == 5s);
    CHECK(request.referer == "https://r/");
    CHECK(request.min_chunk_size == 1234);  // Untouched
    CHECK(!request.user_agent);
}

TEST_CASE("Settings::load", "[settings]") {
    surge::test::TempDir dir;

    SECTION("Reads a file") {
        auto path = dir.file("surge.json");
        std::ofstream(path) << R"({"max_chunk_retries": 7})";
        auto settings = Settings::load(path);
        REQUIRE(settings.has_value());
        CHECK(settings->max_chunk_retries == 7u);
    }

    SECTION("Missing file") {
        auto settings = Settings::load(dir.file("missing.json"));
        REQUIRE(!settings.has_value());
        CHECK(settings.error() == surge::disk::DiskErrc::file_not_found);
    }
}
