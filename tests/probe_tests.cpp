// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/probe.hpp>
#include <surge/core/config.hpp>
#include "fake_transport.hpp"

using namespace surge::core;
using surge::test::FakeTransport;
using surge::test::make_body;

namespace {

DownloadRequest request_for(std::string url) {
    DownloadRequest request;
    request.url = std::move(url);
    request.destination = "unused";
    return request;
}

} // namespace

TEST_CASE("Prober reports size and range support", "[probe]") {
    FakeTransport transport(make_body(5000));
    Prober prober(transport);

    SECTION("Range-capable server") {
        auto result = prober.probe(request_for("https://example.com/files/game.zip"));
        REQUIRE(result.has_value());
        CHECK(result->status_code == 200);
        CHECK(result->total_size == 5000u);
        CHECK(result->supports_range);
        CHECK(result->can_split());
        CHECK(result->content_type == "application/zip");
    }

    SECTION("No Accept-Ranges") {
        transport.accept_ranges = false;
        auto result = prober.probe(request_for("https://example.com/files/game.zip"));
        REQUIRE(result.has_value());
        CHECK(!result->supports_range);
        CHECK(!result->can_split());
        CHECK(result->total_size == 5000u);
    }

    CHECK(transport.head_count() == 1);
    CHECK(transport.get_count() == 0);
}

TEST_CASE("Prober degrades instead of failing", "[probe]") {
    FakeTransport transport(make_body(100));
    Prober prober(transport);

    SECTION("Non-2xx status") {
        transport.head_status = 403;
        auto result = prober.probe(request_for("https://example.com/a.zip"));
        REQUIRE(result.has_value());
        CHECK(result->status_code == 403);
        CHECK(!result->supports_range);
        CHECK(!result->total_size);
    }

    SECTION("Transport failure") {
        transport.head_error = make_error_code(DownloadErrc::connection_lost);
        auto result = prober.probe(request_for("https://example.com/a.zip"));
        REQUIRE(result.has_value());
        CHECK(result->status_code == 0);
        CHECK(result->degraded_by == DownloadErrc::connection_lost);
        CHECK(!result->can_split());
    }
}

TEST_CASE("Prober fatal errors", "[probe]") {
    FakeTransport transport(make_body(100));
    Prober prober(transport);

    SECTION("Unresolvable host") {
        transport.head_error = make_error_code(DownloadErrc::dns_error);
        auto result = prober.probe(request_for("https://nowhere.invalid/a.zip"));
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::probe_failed);
        CHECK(result.error() == ErrorKind::probe);
    }

    SECTION("Malformed URL never reaches the network") {
        auto result = prober.probe(request_for("not a url"));
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_url);
        CHECK(transport.head_count() == 0);
    }

    SECTION("Non-HTTP scheme") {
        auto result = prober.probe(request_for("ftp://example.com/a.zip"));
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::unsupported_scheme);
        CHECK(transport.head_count() == 0);
    }
}

TEST_CASE("Probe request headers", "[probe]") {
    FakeTransport transport(make_body(100));
    Prober prober(transport);

    SECTION("Defaults: browser user agent, inferred referer") {
        REQUIRE(prober.probe(request_for("https://example.com/files/set/game.zip")).has_value());
        auto sent = transport.last_request();
        REQUIRE(sent.has_value());
        CHECK(sent->user_agent == DEFAULT_USER_AGENT);
        CHECK(sent->referer == "https://example.com/files/set/");
        CHECK(!sent->range);
    }

    SECTION("Root file uses the site as referer") {
        REQUIRE(prober.probe(request_for("https://example.com/game.zip")).has_value());
        CHECK(transport.last_request()->referer == "https://example.com/");
    }

    SECTION("Overrides") {
        auto request = request_for("https://example.com/files/game.zip");
        request.referer = "https://portal.example/";
        request.user_agent = "custom/1.0";
        REQUIRE(prober.probe(request).has_value());
        CHECK(transport.last_request()->referer == "https://portal.example/");
        CHECK(transport.last_request()->user_agent == "custom/1.0");
    }
}

TEST_CASE("parse_content_range", "[probe][http]") {
    auto range = parse_content_range("bytes 0-499/1234");
    REQUIRE(range.has_value());
    CHECK(range->start == 0);
    CHECK(range->end == 499);
    CHECK(range->total == 1234u);

    auto open = parse_content_range("bytes 100-199/*");
    REQUIRE(open.has_value());
    CHECK(!open->total);

    CHECK(!parse_content_range("bytes */1234"));
    CHECK(!parse_content_range("items 0-1/2"));
    CHECK(!parse_content_range("bytes 9-1/20"));
    CHECK(!parse_content_range("bytes 0-1/abc"));
}

TEST_CASE("Content-Disposition file name", "[probe][http]") {
    CHECK(HttpSession::parse_content_disposition("attachment; filename=file.zip") == "file.zip");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"my game.zip\"") == "my game.zip");
    CHECK(HttpSession::parse_content_disposition("inline") == "");
}
