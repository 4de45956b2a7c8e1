// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/disk/file_writer.hpp>
#include "fake_transport.hpp"
#include <filesystem>
#include <thread>
#include <vector>

using namespace surge::disk;
using surge::test::TempDir;
using surge::test::make_body;
using surge::test::read_file;

TEST_CASE("FileWriter open", "[disk]") {
    TempDir dir;

    SECTION("Pre-sizes the file") {
        FileWriter file;
        REQUIRE(!file.open(dir.file("sized.bin"), 1 << 20));
        CHECK(file.is_open());
        CHECK(std::filesystem::file_size(dir.file("sized.bin")) == (1u << 20));
        CHECK(!file.close());
        CHECK(!file.is_open());
    }

    SECTION("Truncates an existing file") {
        {
            FileWriter file;
            REQUIRE(!file.open(dir.file("t.bin"), 100));
            CHECK(!file.close());
        }
        FileWriter file;
        REQUIRE(!file.open(dir.file("t.bin"), 0));
        CHECK(!file.close());
        CHECK(std::filesystem::file_size(dir.file("t.bin")) == 0);
    }

    SECTION("Missing parent directory") {
        FileWriter file;
        auto ec = file.open(dir.file("no/such/dir/x.bin"), 10);
        CHECK(ec == DiskErrc::file_not_found);
        CHECK(!file.is_open());
    }

    SECTION("Opening twice is rejected") {
        FileWriter file;
        REQUIRE(!file.open(dir.file("a.bin"), 0));
        CHECK(file.open(dir.file("b.bin"), 0) == DiskErrc::handle_invalid);
    }

    SECTION("Write on a closed file") {
        FileWriter file;
        char c = 'x';
        CHECK(file.write(0, &c, 1) == DiskErrc::handle_invalid);
        CHECK(!file.close());
    }
}

TEST_CASE("FileWriter positioned writes", "[disk]") {
    TempDir dir;
    const auto body = make_body(256 * 1024);
    const auto path = dir.file("out.bin");

    FileWriter file;
    REQUIRE(!file.open(path, body.size()));

    SECTION("Disjoint ranges from several threads") {
        constexpr std::size_t parts = 8;
        const std::size_t part = body.size() / parts;
        std::vector<std::error_code> errors(parts);
        std::vector<std::jthread> threads;
        // Reverse order so nothing relies on sequential writes
        for (std::size_t i = parts; i-- > 0;) {
            threads.emplace_back([&, i] {
                errors[i] = file.write(i * part, body.data() + i * part, part);
            });
        }
        threads.clear();
        for (const auto& ec : errors) {
            CHECK(!ec);
        }
        REQUIRE(!file.flush());
        REQUIRE(!file.close());
        CHECK(read_file(path) == body);
    }

    SECTION("Moved writer keeps the descriptor") {
        FileWriter moved = std::move(file);
        CHECK(moved.is_open());
        CHECK(!file.is_open());
        CHECK(moved.path() == path);
        REQUIRE(!moved.write(0, body.data(), body.size()));
        REQUIRE(!moved.close());
        CHECK(read_file(path) == body);
    }
}

TEST_CASE("BufferedWriter", "[disk]") {
    TempDir dir;
    const auto path = dir.file("stream.bin");
    const auto body = make_body(10'000);

    FileWriter file;
    REQUIRE(!file.open(path, 0));
    BufferedWriter writer(file, 4096);

    SECTION("Small appends are coalesced") {
        for (std::size_t off = 0; off < body.size(); off += 100) {
            REQUIRE(!writer.append(body.data() + off, std::min<std::size_t>(100, body.size() - off)));
        }
        CHECK(writer.size() == body.size());
        REQUIRE(!writer.flush());
        REQUIRE(!file.close());
        CHECK(read_file(path) == body);
    }

    SECTION("Large appends bypass the buffer") {
        REQUIRE(!writer.append(body.data(), 10));
        REQUIRE(!writer.append(body.data() + 10, body.size() - 10));
        REQUIRE(!writer.flush());
        REQUIRE(!file.close());
        CHECK(read_file(path) == body);
    }

    SECTION("Unflushed data is not on disk") {
        REQUIRE(!writer.append(body.data(), 100));
        CHECK(std::filesystem::file_size(path) == 0);
        REQUIRE(!writer.flush());
        CHECK(std::filesystem::file_size(path) == 100);
    }
}
