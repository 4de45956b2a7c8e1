// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/chunk.hpp>
#include <surge/core/download_request.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/probe.hpp>
#include <surge/core/progress.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace surge::core {

// Lifecycle of one download() call
enum class DownloadState : std::uint8_t {
    idle,
    probing,
    planning,
    fetching_parallel,
    fetching_single,
    finalizing,
    done,
    aborted
};

enum class DownloadStrategy : std::uint8_t {
    already_present,  // Destination existed, nothing fetched
    parallel,
    single_stream
};

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;
[[nodiscard]] std::string_view to_string(DownloadStrategy strategy) noexcept;

struct DownloadSummary {
    DownloadStrategy strategy{DownloadStrategy::already_present};
    std::uint64_t total_bytes{0};
    std::size_t chunk_count{0};      // 0 for single-stream
    std::uint32_t stream_attempts{0};
    std::string path;
    std::chrono::milliseconds elapsed{0};
};

using StateCallback = std::function<void(DownloadState)>;

// Entry point of the downloader.
//
// Probes the resource, downloads it in parallel chunks or as a single stream
// into <destination>.tmp, and renames the temp file onto the destination once
// every byte is on disk. On failure or cancellation the temp file is removed
// and the destination is never created.
//
// The engine keeps no per-download state: concurrent download() calls on one
// engine are independent. Progress callbacks run on the calling thread.
class DownloadEngine {
public:
    explicit DownloadEngine(HttpTransport& transport) noexcept : transport_(transport) {}

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    [[nodiscard]] std::expected<DownloadSummary, std::error_code>
    download(const DownloadRequest& request,
             const ProgressCallback& progress = {},
             std::stop_token stop = {}) noexcept;

    // Observer for state transitions, invoked on the calling thread
    void state_callback(StateCallback cb) noexcept { state_callback_ = std::move(cb); }

private:
    struct Context;

    [[nodiscard]] std::error_code fetch_parallel(Context& ctx, const ChunkPlan& plan, std::uint64_t total) noexcept;
    [[nodiscard]] std::error_code fetch_single(Context& ctx, std::uint64_t announced_total) noexcept;
    [[nodiscard]] std::error_code finalize(Context& ctx) noexcept;
    void abort(Context& ctx, const std::error_code& ec) noexcept;
    void transition(Context& ctx, DownloadState next) noexcept;

    HttpTransport& transport_;
    StateCallback state_callback_;
};

} // namespace surge::core
