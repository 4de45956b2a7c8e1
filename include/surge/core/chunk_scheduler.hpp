// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk.hpp>
#include <surge/core/progress.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace surge::core {

// One attempt at one range; normally ChunkFetcher::fetch
using ChunkFetchFn = std::function<std::error_code(const ByteRange&, std::stop_token)>;

struct SchedulerOptions {
    std::uint32_t worker_count{1};
    std::uint32_t max_attempts{1};           // Total attempts per chunk
    std::chrono::milliseconds backoff_unit{1000};
};

// Sleeps for `duration` unless `stop` is requested first.
// Returns false when woken by a stop request.
[[nodiscard]] bool backoff_wait(std::chrono::milliseconds duration, std::stop_token stop);

// Fixed pool of workers draining a shared queue of chunk jobs.
//
// A job that fails with a retryable error is retried after
// attempt * backoff_unit, with its progress reset to zero. The first terminal
// failure stops every worker and abandons the queue; error() reports it.
class ChunkScheduler {
public:
    ChunkScheduler(ChunkFetchFn fetch, ProgressAggregator& progress, SchedulerOptions options);
    ~ChunkScheduler();

    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    // Queue the ranges and spawn the workers. `cancel` is linked to the
    // internal stop source. Fails only if a worker thread cannot be created.
    [[nodiscard]] std::error_code start(const std::vector<ByteRange>& ranges,
                                        std::stop_token cancel = {}) noexcept;

    // Block up to `timeout`; true once every worker has exited
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);
    void wait();

    // Stop all workers (does not wait)
    void stop() noexcept { stop_source_.request_stop(); }

    // First terminal error; cancelled if stopped before all chunks finished
    [[nodiscard]] std::error_code error() const;

    [[nodiscard]] std::vector<ChunkResult> results() const;
    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

private:
    void worker_loop(std::stop_token stop) noexcept;
    void run_job(ChunkJob job, std::stop_token stop) noexcept;
    void record(ChunkResult result) noexcept;

    ChunkFetchFn fetch_;
    ProgressAggregator& progress_;
    SchedulerOptions options_;

    std::deque<ChunkJob> queue_;
    std::vector<ChunkResult> results_;
    std::error_code error_;
    std::size_t total_jobs_{0};
    std::size_t running_{0};
    mutable std::mutex mutex_;
    std::condition_variable done_cv_;

    std::stop_source stop_source_;
    std::optional<std::stop_callback<std::function<void()>>> cancel_link_;
    std::vector<std::jthread> workers_;
};

} // namespace surge::core
