// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/chunk_scheduler.hpp>
#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <thread>

using namespace surge::core;
using namespace std::chrono_literals;

namespace {

// Records calls per range start and answers with a scripted sequence of errors
class ScriptedFetch {
public:
    void script(std::uint64_t start, std::vector<std::error_code> errors) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[start] = std::move(errors);
    }

    std::error_code operator()(const ByteRange& range, std::stop_token stop) {
        std::error_code result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& calls = calls_[range.start];
            auto& errors = scripts_[range.start];
            if (static_cast<std::size_t>(calls) < errors.size()) {
                result = errors[static_cast<std::size_t>(calls)];
            }
            ++calls;
        }
        if (stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }
        return result;
    }

    int calls(std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[start];
    }

    int total_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        int sum = 0;
        for (const auto& [start, n] : calls_) sum += n;
        return sum;
    }

private:
    std::map<std::uint64_t, std::vector<std::error_code>> scripts_;
    std::map<std::uint64_t, int> calls_;
    std::mutex mutex_;
};

ChunkFetchFn bind(ScriptedFetch& fetch) {
    return [&fetch](const ByteRange& range, std::stop_token stop) { return fetch(range, stop); };
}

SchedulerOptions options(std::uint32_t workers, std::uint32_t attempts) {
    return SchedulerOptions{workers, attempts, 1ms};
}

} // namespace

TEST_CASE("ChunkScheduler completes every chunk", "[scheduler]") {
    ScriptedFetch fetch;
    ProgressAggregator progress;
    ChunkScheduler scheduler(bind(fetch), progress, options(4, 3));

    auto ranges = partition_ranges(1000, 100);
    REQUIRE(!scheduler.start(ranges));
    scheduler.wait();

    CHECK(!scheduler.error());
    CHECK(scheduler.worker_count() == 4);
    CHECK(fetch.total_calls() == 10);

    auto results = scheduler.results();
    REQUIRE(results.size() == 10);
    for (const auto& result : results) {
        CHECK(result.ok());
        CHECK(result.attempts == 1);
        CHECK(result.bytes_written == result.range.length());
    }
}

TEST_CASE("ChunkScheduler never spawns more workers than chunks", "[scheduler]") {
    ScriptedFetch fetch;
    ProgressAggregator progress;
    ChunkScheduler scheduler(bind(fetch), progress, options(8, 1));

    REQUIRE(!scheduler.start(partition_ranges(300, 100)));
    CHECK(scheduler.worker_count() == 3);
    scheduler.wait();
    CHECK(!scheduler.error());
}

TEST_CASE("ChunkScheduler retries transient failures", "[scheduler]") {
    ScriptedFetch fetch;
    ProgressAggregator progress;
    const auto lost = make_error_code(DownloadErrc::connection_lost);

    SECTION("Succeeds within the attempt budget") {
        fetch.script(300, {lost, make_http_error(503)});
        progress.report(300, 42);  // Bytes from a failed attempt

        ChunkScheduler scheduler(bind(fetch), progress, options(2, 3));
        REQUIRE(!scheduler.start(partition_ranges(1000, 100)));
        scheduler.wait();

        CHECK(!scheduler.error());
        CHECK(fetch.calls(300) == 3);
        CHECK(progress.chunk(300) == 0);  // Reset before each retry

        for (const auto& result : scheduler.results()) {
            if (result.range.start == 300) {
                CHECK(result.attempts == 3);
            }
        }
    }

    SECTION("Exhaustion aborts the download") {
        fetch.script(300, {lost, lost, lost});

        ChunkScheduler scheduler(bind(fetch), progress, options(1, 3));
        REQUIRE(!scheduler.start(partition_ranges(1000, 100)));
        scheduler.wait();

        CHECK(scheduler.error() == DownloadErrc::connection_lost);
        CHECK(fetch.calls(300) == 3);
        // Single worker in order: nothing after the failed chunk is attempted
        CHECK(fetch.calls(400) == 0);
    }
}

TEST_CASE("ChunkScheduler does not retry terminal failures", "[scheduler]") {
    ScriptedFetch fetch;
    ProgressAggregator progress;

    SECTION("Write error is attempted exactly once") {
        fetch.script(0, {surge::disk::make_error_code(surge::disk::DiskErrc::disk_full)});
        ChunkScheduler scheduler(bind(fetch), progress, options(1, 5));
        REQUIRE(!scheduler.start(partition_ranges(500, 100)));
        scheduler.wait();

        CHECK(scheduler.error() == surge::disk::DiskErrc::disk_full);
        CHECK(scheduler.error() == ErrorKind::write);
        CHECK(fetch.calls(0) == 1);
        CHECK(fetch.total_calls() == 1);
    }

    SECTION("Cancelled fetch is not retried") {
        fetch.script(0, {make_error_code(DownloadErrc::cancelled)});
        ChunkScheduler scheduler(bind(fetch), progress, options(1, 5));
        REQUIRE(!scheduler.start(partition_ranges(100, 100)));
        scheduler.wait();

        CHECK(scheduler.error() == ErrorKind::cancelled);
        CHECK(fetch.calls(0) == 1);
    }
}

TEST_CASE("ChunkScheduler honours external cancellation", "[scheduler]") {
    std::atomic<int> calls{0};
    ProgressAggregator progress;
    std::stop_source cancel;

    // Each fetch blocks until stopped
    ChunkFetchFn blocking = [&calls](const ByteRange&, std::stop_token stop) {
        ++calls;
        (void)backoff_wait(10s, stop);
        return make_error_code(DownloadErrc::cancelled);
    };

    ChunkScheduler scheduler(blocking, progress, options(2, 3));
    REQUIRE(!scheduler.start(partition_ranges(1000, 100), cancel.get_token()));

    CHECK(!scheduler.wait_for(50ms));
    cancel.request_stop();
    CHECK(scheduler.wait_for(5s));

    CHECK(scheduler.error() == DownloadErrc::cancelled);
    CHECK(calls.load() == 2);
}

TEST_CASE("ChunkScheduler backoff is interruptible", "[scheduler]") {
    ScriptedFetch fetch;
    ProgressAggregator progress;
    fetch.script(0, {make_error_code(DownloadErrc::timeout)});

    ChunkScheduler scheduler(bind(fetch), progress, SchedulerOptions{1, 3, 60s});
    REQUIRE(!scheduler.start(partition_ranges(100, 100)));

    CHECK(!scheduler.wait_for(50ms));  // Sitting in a 60s backoff
    scheduler.stop();
    CHECK(scheduler.wait_for(5s));
    CHECK(scheduler.error() == DownloadErrc::cancelled);
    CHECK(fetch.calls(0) == 1);
}

TEST_CASE("backoff_wait", "[scheduler]") {
    std::stop_source stop;
    CHECK(backoff_wait(1ms, stop.get_token()));
    stop.request_stop();
    CHECK(!backoff_wait(10s, stop.get_token()));
}
