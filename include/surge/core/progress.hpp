// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>

namespace surge::core {

// (downloaded_bytes, total_bytes)
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

// Per-chunk byte counts shared by all workers of one download.
//
// Keyed by chunk start offset, so a retry that reports 0 for its chunk
// replaces the failed attempt's count instead of adding to it. total() is
// recomputed from the map on every call.
class ProgressAggregator {
public:
    ProgressAggregator() = default;

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void report(std::uint64_t chunk_start, std::uint64_t bytes_so_far) noexcept;
    void reset(std::uint64_t chunk_start) noexcept { report(chunk_start, 0); }

    [[nodiscard]] std::uint64_t total() const noexcept;
    [[nodiscard]] std::uint64_t chunk(std::uint64_t chunk_start) const noexcept;
    [[nodiscard]] std::size_t chunk_count() const noexcept;

private:
    std::map<std::uint64_t, std::uint64_t> chunks_;
    mutable std::mutex mutex_;
};

// Rate-limits progress callbacks. Not thread-safe: owned by the thread that
// polls the aggregator.
class ProgressThrottle {
public:
    using clock = std::chrono::steady_clock;

    ProgressThrottle(ProgressCallback callback,
                     std::uint64_t total_bytes,
                     std::chrono::milliseconds interval) noexcept;

    // Emit if the interval has elapsed and the value did not go backwards
    void update(std::uint64_t downloaded) { update(downloaded, clock::now()); }
    void update(std::uint64_t downloaded, clock::time_point now);

    // Unconditional final emission of (total, total)
    void finish();

    void total(std::uint64_t t) noexcept { total_ = t; }
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    [[nodiscard]] std::uint64_t last_emitted() const noexcept { return last_emitted_; }
    [[nodiscard]] std::uint32_t emissions() const noexcept { return emissions_; }

private:
    void emit(std::uint64_t downloaded, clock::time_point now);

    ProgressCallback callback_;
    std::uint64_t total_;
    std::chrono::milliseconds interval_;
    std::uint64_t last_emitted_{0};
    std::uint32_t emissions_{0};
    clock::time_point last_emit_time_{};
    bool finished_{false};
};

} // namespace surge::core
