// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/chunk.hpp>
#include <surge/core/config.hpp>
#include <random>

using namespace surge::core;

namespace {

constexpr std::uint64_t MB = 1024 * 1024;

// Ranges must tile [0, total) exactly: ascending, contiguous, no overlap
void require_partition(const std::vector<ByteRange>& ranges, std::uint64_t total) {
    REQUIRE(!ranges.empty());
    CHECK(ranges.front().start == 0);
    CHECK(ranges.back().end == total - 1);

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        REQUIRE(ranges[i].end >= ranges[i].start);
        if (i > 0) {
            REQUIRE(ranges[i].start == ranges[i - 1].end + 1);
        }
        sum += ranges[i].length();
    }
    CHECK(sum == total);
}

} // namespace

TEST_CASE("ByteRange formatting", "[chunk]") {
    ByteRange range{100, 199};
    CHECK(range.length() == 100);
    CHECK(range.header_value() == "bytes=100-199");
    CHECK(range.to_string() == "100-199");
}

TEST_CASE("partition_ranges", "[chunk]") {
    SECTION("Exact multiple") {
        auto ranges = partition_ranges(40 * MB, 4 * MB);
        CHECK(ranges.size() == 10);
        require_partition(ranges, 40 * MB);
    }

    SECTION("Remainder goes to the last range") {
        auto ranges = partition_ranges(10, 4);
        REQUIRE(ranges.size() == 3);
        CHECK(ranges[2] == (ByteRange{8, 9}));
        require_partition(ranges, 10);
    }

    SECTION("Zero size yields nothing") {
        CHECK(partition_ranges(0, 4).empty());
    }

    SECTION("Chunk larger than the total") {
        auto ranges = partition_ranges(3, 100);
        REQUIRE(ranges.size() == 1);
        CHECK(ranges[0] == (ByteRange{0, 2}));
    }

    SECTION("No overflow near the top of the range") {
        const std::uint64_t total = UINT64_MAX - 5;
        auto ranges = partition_ranges(total, total / 2);
        REQUIRE(ranges.size() == 3);
        CHECK(ranges.back().end == total - 1);
    }

    SECTION("Random sizes always partition exactly") {
        std::mt19937_64 rng(1234);
        std::uniform_int_distribution<std::uint64_t> size_dist(1, 50 * MB);
        std::uniform_int_distribution<std::uint64_t> chunk_dist(1, 8 * MB);
        for (int i = 0; i < 200; ++i) {
            auto total = size_dist(rng);
            require_partition(partition_ranges(total, chunk_dist(rng)), total);
        }
    }
}

TEST_CASE("plan_chunks", "[chunk]") {
    SECTION("40 MB with 4 workers and 4 MB minimum gives ten chunks") {
        auto plan = plan_chunks(40 * MB, 4, 4 * MB);
        CHECK(!plan.single_stream);
        CHECK(plan.ranges.size() == 10);
        CHECK(plan.worker_share == 10 * MB);
        require_partition(plan.ranges, 40 * MB);
    }

    SECTION("Worker count does not change the chunking") {
        for (std::uint32_t workers : {1u, 2u, 8u, 32u}) {
            auto plan = plan_chunks(40 * MB, workers, 4 * MB);
            CHECK(plan.ranges.size() == 10);
        }
    }

    SECTION("Small files stream") {
        CHECK(plan_chunks(2 * MB, 4, 4 * MB).single_stream);
        CHECK(plan_chunks(8 * MB, 4, 4 * MB).single_stream);
        CHECK(!plan_chunks(8 * MB + 1, 4, 4 * MB).single_stream);
    }

    SECTION("Unknown or empty size streams") {
        auto plan = plan_chunks(0, 4, 4 * MB);
        CHECK(plan.single_stream);
        CHECK(plan.ranges.empty());
    }

    SECTION("Zero workers is treated as one") {
        auto plan = plan_chunks(40 * MB, 0, 4 * MB);
        CHECK(plan.worker_share == 40 * MB);
        CHECK(plan.ranges.size() == 10);
    }

    SECTION("Share never drops below the minimum") {
        auto plan = plan_chunks(20 * MB, 16, DEFAULT_MIN_CHUNK_SIZE);
        CHECK(plan.worker_share == DEFAULT_MIN_CHUNK_SIZE);
    }
}
