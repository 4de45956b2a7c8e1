// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk_scheduler.hpp>
#include <surge/core/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace surge::core {

bool backoff_wait(std::chrono::milliseconds duration, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

//=============================================================================
// ChunkScheduler
//=============================================================================

ChunkScheduler::ChunkScheduler(ChunkFetchFn fetch, ProgressAggregator& progress, SchedulerOptions options)
    : fetch_(std::move(fetch))
    , progress_(progress)
    , options_(options) {
    if (options_.worker_count == 0) options_.worker_count = 1;
    if (options_.max_attempts == 0) options_.max_attempts = 1;
}

ChunkScheduler::~ChunkScheduler() {
    // Workers reference this object: join them before anything else goes away
    stop_source_.request_stop();
    workers_.clear();
    cancel_link_.reset();
}

std::error_code ChunkScheduler::start(const std::vector<ByteRange>& ranges, std::stop_token cancel) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& range : ranges) {
            queue_.push_back(ChunkJob{range, 0});
        }
        total_jobs_ = ranges.size();
    }

    if (cancel.stop_possible()) {
        cancel_link_.emplace(cancel, std::function<void()>([this] { stop_source_.request_stop(); }));
    }

    auto count = std::min<std::size_t>(options_.worker_count, ranges.size());
    spdlog::debug("Scheduling {} chunks on {} workers", ranges.size(), count);

    try {
        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++running_;
            }
            workers_.emplace_back([this] { worker_loop(stop_source_.get_token()); });
        }
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start chunk worker: {}", e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;  // The thread that failed to spawn
            if (!error_) error_ = e.code();
        }
        stop_source_.request_stop();
        return e.code();
    }
    return {};
}

bool ChunkScheduler::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return running_ == 0; });
}

void ChunkScheduler::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return running_ == 0; });
}

std::error_code ChunkScheduler::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_) {
        return error_;
    }
    if (results_.size() < total_jobs_) {
        return make_error_code(DownloadErrc::cancelled);
    }
    return {};
}

std::vector<ChunkResult> ChunkScheduler::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

void ChunkScheduler::worker_loop(std::stop_token stop) noexcept {
    while (!stop.stop_requested()) {
        ChunkJob job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) break;
            job = queue_.front();
            queue_.pop_front();
        }
        run_job(job, stop);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
    }
    done_cv_.notify_all();
}

void ChunkScheduler::run_job(ChunkJob job, std::stop_token stop) noexcept {
    for (;;) {
        auto ec = fetch_(job.range, stop);
        if (!ec) {
            record(ChunkResult{job.range, job.range.length(), job.attempt + 1, {}});
            return;
        }

        if (stop.stop_requested() && ec != DownloadErrc::cancelled) {
            ec = make_error_code(DownloadErrc::cancelled);
        }

        const bool last_attempt = job.attempt + 1 >= options_.max_attempts;
        if (!is_retryable(ec) || last_attempt) {
            if (ec != DownloadErrc::cancelled) {
                spdlog::error("Chunk {} failed after {} attempt(s): {}",
                              job.range.to_string(), job.attempt + 1, ec.message());
            }
            record(ChunkResult{job.range, progress_.chunk(job.range.start), job.attempt + 1, ec});
            return;
        }

        auto delay = options_.backoff_unit * (job.attempt + 1);
        spdlog::warn("Chunk {} attempt {}/{} failed: {}, retrying in {}ms",
                     job.range.to_string(), job.attempt + 1, options_.max_attempts,
                     ec.message(), delay.count());

        if (!backoff_wait(delay, stop)) {
            record(ChunkResult{job.range, progress_.chunk(job.range.start), job.attempt + 1,
                               make_error_code(DownloadErrc::cancelled)});
            return;
        }

        progress_.reset(job.range.start);
        job = ChunkJob{job.range, job.attempt + 1};
    }
}

void ChunkScheduler::record(ChunkResult result) noexcept {
    bool failed = !result.ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failed && !error_) {
            error_ = result.error;
        }
        results_.push_back(std::move(result));
    }
    if (failed) {
        stop_source_.request_stop();
    }
}

} // namespace surge::core
