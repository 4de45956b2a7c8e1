// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/chunk_fetcher.hpp>
#include "fake_transport.hpp"
#include <map>
#include <mutex>

using namespace surge::core;
using namespace surge::test;

namespace {

struct FetchFixture {
    std::vector<std::byte> body = make_body(10'000);
    FakeTransport transport{body};
    TempDir dir;
    std::string path = dir.file("chunk.bin");
    surge::disk::FileWriter file;
    std::map<std::uint64_t, std::uint64_t> progress;
    std::mutex progress_mutex;

    FetchFixture() {
        REQUIRE(!file.open(path, body.size()));
    }

    ChunkFetcher fetcher() {
        HttpRequest base;
        base.url = "https://example.com/file.bin";
        return ChunkFetcher(transport, base, file, [this](std::uint64_t start, std::uint64_t bytes) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress[start] = bytes;
        });
    }

    std::vector<std::byte> slice(const ByteRange& range) {
        auto content = read_file(path);
        return {content.begin() + static_cast<std::ptrdiff_t>(range.start),
                content.begin() + static_cast<std::ptrdiff_t>(range.end + 1)};
    }

    std::vector<std::byte> expected(const ByteRange& range) {
        return {body.begin() + static_cast<std::ptrdiff_t>(range.start),
                body.begin() + static_cast<std::ptrdiff_t>(range.end + 1)};
    }
};

} // namespace

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher writes a 206 at its offset", "[fetcher]") {
    transport.piece_size = 1000;
    ByteRange range{2500, 7499};

    auto ec = fetcher().fetch(range, {});
    REQUIRE(!ec);
    REQUIRE(!file.close());

    CHECK(slice(range) == expected(range));
    CHECK(progress[2500] == range.length());

    auto sent = transport.ranges();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0] == range);
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher validates the response", "[fetcher]") {
    SECTION("Wrong Content-Range") {
        transport.fail(1000, 1, Fault{Fault::Type::wrong_content_range});
        auto ec = fetcher().fetch({1000, 1999}, {});
        CHECK(ec == DownloadErrc::range_mismatch);
        CHECK(ec == ErrorKind::http_status);
        CHECK(progress[1000] == 0);
    }

    SECTION("Full body for a later chunk") {
        transport.honor_ranges = false;
        auto ec = fetcher().fetch({1000, 1999}, {});
        CHECK(ec == DownloadErrc::unexpected_full_response);
    }

    SECTION("Full body for the first chunk is truncated to the range") {
        transport.honor_ranges = false;
        ByteRange range{0, 2999};
        auto ec = fetcher().fetch(range, {});
        REQUIRE(!ec);
        REQUIRE(!file.close());
        CHECK(slice(range) == expected(range));
        CHECK(progress[0] == 3000);
    }

    SECTION("Error status carries the code") {
        transport.fail(0, 1, Fault{Fault::Type::status, {}, 503});
        auto ec = fetcher().fetch({0, 99}, {});
        CHECK(ec == make_http_error(503));
        CHECK(ec == ErrorKind::http_status);
    }

    SECTION("Missing status line is a network error") {
        transport.get_status = 0;
        auto ec = fetcher().fetch({0, 99}, {});
        CHECK(ec == DownloadErrc::network_error);
        CHECK(progress[0] == 0);
    }

    SECTION("Body longer than the range") {
        transport.fail(2000, 1, Fault{Fault::Type::overlong_body});
        auto ec = fetcher().fetch({2000, 2999}, {});
        CHECK(ec == DownloadErrc::range_mismatch);
        CHECK(progress[2000] == 1000);
    }

    SECTION("Body ends before the range is complete") {
        transport.fail(3000, 1, Fault{Fault::Type::truncated_body});
        auto ec = fetcher().fetch({3000, 3999}, {});
        CHECK(ec == DownloadErrc::short_body);
        CHECK(ec == ErrorKind::transport);
        CHECK(progress[3000] == 500);
    }

    SECTION("206 without Content-Range is checked by length") {
        transport.fail(5000, 1, Fault{Fault::Type::no_content_range});
        ByteRange range{5000, 6999};
        auto ec = fetcher().fetch(range, {});
        REQUIRE(!ec);
        REQUIRE(!file.close());
        CHECK(slice(range) == expected(range));
    }

    SECTION("Connection drop mid-body") {
        transport.fail(4000, 1, Fault{Fault::Type::garbage});
        auto ec = fetcher().fetch({4000, 4999}, {});
        CHECK(ec == DownloadErrc::connection_lost);
        CHECK(progress[4000] == 500);
    }
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher stops when cancelled", "[fetcher]") {
    std::stop_source stop;
    stop.request_stop();
    auto ec = fetcher().fetch({0, 999}, stop.get_token());
    CHECK(ec == DownloadErrc::cancelled);
    CHECK(ec == ErrorKind::cancelled);
}

TEST_CASE("ChunkFetcher reports write errors", "[fetcher]") {
    FakeTransport transport(make_body(1000));
    surge::disk::FileWriter closed;  // Never opened
    HttpRequest base;
    base.url = "https://example.com/file.bin";
    ChunkFetcher fetcher(transport, base, closed, {});

    auto ec = fetcher.fetch({0, 99}, {});
    CHECK(ec == surge::disk::DiskErrc::handle_invalid);
    CHECK(ec == ErrorKind::write);
}
