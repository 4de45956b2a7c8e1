// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_engine.hpp>
#include <surge/core/chunk_fetcher.hpp>
#include <surge/core/chunk_scheduler.hpp>
#include <surge/core/config.hpp>
#include <surge/core/single_stream.hpp>
#include <surge/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace surge::core {

std::string_view to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:              return "idle";
        case DownloadState::probing:           return "probing";
        case DownloadState::planning:          return "planning";
        case DownloadState::fetching_parallel: return "fetching_parallel";
        case DownloadState::fetching_single:   return "fetching_single";
        case DownloadState::finalizing:        return "finalizing";
        case DownloadState::done:              return "done";
        case DownloadState::aborted:           return "aborted";
    }
    return "unknown";
}

std::string_view to_string(DownloadStrategy strategy) noexcept {
    switch (strategy) {
        case DownloadStrategy::already_present: return "already_present";
        case DownloadStrategy::parallel:        return "parallel";
        case DownloadStrategy::single_stream:   return "single_stream";
    }
    return "unknown";
}

namespace {

// std::filesystem reports errno values; bring them into the disk category
std::error_code to_disk_error(const std::error_code& ec) noexcept {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return disk::from_errno(ec.value());
    }
    return ec;
}

} // namespace

// Everything owned by one download() call
struct DownloadEngine::Context {
    Context(const DownloadRequest& req, HttpRequest base, const ProgressCallback& progress, std::stop_token token)
        : request(req)
        , http(std::move(base))
        , temp_path(req.temp_path())
        , stop(std::move(token))
        , throttle(progress, 0, req.progress_interval)
        , info_level(req.quiet ? spdlog::level::debug : spdlog::level::info) {}

    const DownloadRequest& request;
    HttpRequest http;
    std::string temp_path;
    std::stop_token stop;
    ProgressThrottle throttle;
    disk::FileWriter file;
    DownloadSummary summary;
    DownloadState state{DownloadState::idle};
    spdlog::level::level_enum info_level;
};

//=============================================================================
// DownloadEngine
//=============================================================================

std::expected<DownloadSummary, std::error_code>
DownloadEngine::download(const DownloadRequest& request,
                         const ProgressCallback& progress,
                         std::stop_token stop) noexcept {
    const auto started = std::chrono::steady_clock::now();

    // A file at the destination is a finished download from an earlier run,
    // whatever the rest of the request says
    std::error_code fs_ec;
    if (!request.destination.empty() && fs::exists(request.destination, fs_ec)) {
        DownloadSummary summary;
        summary.strategy = DownloadStrategy::already_present;
        summary.path = request.destination;
        auto size = fs::file_size(request.destination, fs_ec);
        summary.total_bytes = fs_ec ? 0 : size;
        spdlog::log(request.quiet ? spdlog::level::debug : spdlog::level::info,
                    "{} already exists, skipping download", request.destination);
        return summary;
    }

    if (auto ec = request.validate()) {
        spdlog::error("Rejected download request for {}: {}", request.url, ec.message());
        return std::unexpected(ec);
    }

    auto http = make_http_request(request);
    if (!http) {
        spdlog::error("Cannot download {}: {}", request.url, http.error().message());
        return std::unexpected(http.error());
    }

    Context ctx(request, std::move(*http), progress, std::move(stop));
    ctx.summary.path = request.destination;

    transition(ctx, DownloadState::probing);
    auto probe = Prober(transport_).probe(ctx.http);
    if (!probe) {
        abort(ctx, probe.error());
        return std::unexpected(probe.error());
    }
    if (ctx.stop.stop_requested()) {
        auto ec = make_error_code(DownloadErrc::cancelled);
        abort(ctx, ec);
        return std::unexpected(ec);
    }

    transition(ctx, DownloadState::planning);

    auto parent = fs::path(request.destination).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, fs_ec);
        if (fs_ec) {
            auto ec = to_disk_error(fs_ec);
            abort(ctx, ec);
            return std::unexpected(ec);
        }
    }

    ChunkPlan plan;
    if (probe->can_split()) {
        plan = plan_chunks(*probe->total_size, request.worker_count, request.min_chunk_size);
    }

    std::error_code ec;
    if (!plan.single_stream) {
        ec = fetch_parallel(ctx, plan, *probe->total_size);
    } else {
        ec = fetch_single(ctx, probe->total_size.value_or(0));
    }

    if (!ec) {
        ec = finalize(ctx);
    }
    if (ec) {
        abort(ctx, ec);
        return std::unexpected(ec);
    }

    ctx.throttle.finish();
    transition(ctx, DownloadState::done);

    ctx.summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::log(ctx.info_level, "Saved {} ({} bytes, {}) in {}ms",
                request.destination, ctx.summary.total_bytes,
                to_string(ctx.summary.strategy), ctx.summary.elapsed.count());
    return ctx.summary;
}

std::error_code DownloadEngine::fetch_parallel(Context& ctx, const ChunkPlan& plan, std::uint64_t total) noexcept {
    transition(ctx, DownloadState::fetching_parallel);

    const auto& request = ctx.request;
    ctx.summary.strategy = DownloadStrategy::parallel;
    ctx.summary.total_bytes = total;
    ctx.summary.chunk_count = plan.ranges.size();
    ctx.throttle.total(total);

    if (auto ec = ctx.file.open(ctx.temp_path, total)) {
        spdlog::error("Cannot create {}: {}", ctx.temp_path, ec.message());
        return ec;
    }

    ProgressAggregator aggregator;
    ChunkFetcher fetcher(transport_, ctx.http, ctx.file,
                         [&aggregator](std::uint64_t start, std::uint64_t bytes) {
                             aggregator.report(start, bytes);
                         });

    ChunkScheduler scheduler(
        [&fetcher](const ByteRange& range, std::stop_token stop) { return fetcher.fetch(range, stop); },
        aggregator,
        SchedulerOptions{request.worker_count, request.max_chunk_retries, request.backoff_unit});

    spdlog::log(ctx.info_level, "Downloading {} bytes in {} chunks with {} workers (share {} bytes)",
                total, plan.ranges.size(), request.worker_count, plan.worker_share);

    if (auto ec = scheduler.start(plan.ranges, ctx.stop)) {
        return ec;
    }

    // Progress is polled here so the callback stays on the caller's thread
    while (!scheduler.wait_for(PROGRESS_POLL_INTERVAL)) {
        ctx.throttle.update(aggregator.total());
    }

    if (auto ec = scheduler.error()) {
        return ec;
    }
    if (aggregator.total() != total) {
        spdlog::error("Chunks account for {} of {} bytes", aggregator.total(), total);
        return make_error_code(DownloadErrc::short_body);
    }
    return {};
}

std::error_code DownloadEngine::fetch_single(Context& ctx, std::uint64_t announced_total) noexcept {
    transition(ctx, DownloadState::fetching_single);

    const auto& request = ctx.request;
    ctx.summary.strategy = DownloadStrategy::single_stream;
    ctx.summary.total_bytes = announced_total;
    ctx.throttle.total(announced_total);

    spdlog::log(ctx.info_level, "Downloading {} as a single stream", request.url);

    SingleStreamFetcher fetcher(transport_, ctx.http);

    for (std::uint32_t attempt = 0;; ++attempt) {
        // Every attempt restarts from byte zero
        if (auto ec = ctx.file.open(ctx.temp_path, 0)) {
            spdlog::error("Cannot create {}: {}", ctx.temp_path, ec.message());
            return ec;
        }

        auto written = fetcher.fetch(ctx.file, ctx.throttle, ctx.stop);
        ctx.summary.stream_attempts = attempt + 1;
        if (written) {
            ctx.summary.total_bytes = *written;
            ctx.throttle.total(*written);
            return {};
        }

        auto ec = written.error();
        if (ctx.stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (!is_retryable(ec) || attempt + 1 >= request.max_chunk_retries) {
            spdlog::error("Stream failed after {} attempt(s): {}", attempt + 1, ec.message());
            return ec;
        }

        if (auto close_ec = ctx.file.close()) {
            return close_ec;
        }

        auto delay = request.backoff_unit * (attempt + 1);
        spdlog::warn("Stream attempt {}/{} failed: {}, retrying in {}ms",
                     attempt + 1, request.max_chunk_retries, ec.message(), delay.count());
        if (!backoff_wait(delay, ctx.stop)) {
            return make_error_code(DownloadErrc::cancelled);
        }
    }
}

std::error_code DownloadEngine::finalize(Context& ctx) noexcept {
    transition(ctx, DownloadState::finalizing);

    if (auto ec = ctx.file.flush()) {
        return ec;
    }
    if (auto ec = ctx.file.close()) {
        return ec;
    }

    std::error_code fs_ec;
    fs::rename(ctx.temp_path, ctx.request.destination, fs_ec);
    if (fs_ec) {
        spdlog::error("Cannot rename {} to {}: {}", ctx.temp_path, ctx.request.destination, fs_ec.message());
        return disk::make_error_code(disk::DiskErrc::rename_failed);
    }
    return {};
}

void DownloadEngine::abort(Context& ctx, const std::error_code& ec) noexcept {
    transition(ctx, DownloadState::aborted);

    if (ctx.file.is_open()) {
        if (auto close_ec = ctx.file.close()) {
            spdlog::debug("Closing {} failed: {}", ctx.temp_path, close_ec.message());
        }
    }

    std::error_code fs_ec;
    fs::remove(ctx.temp_path, fs_ec);
    if (fs_ec) {
        spdlog::warn("Could not remove {}: {}", ctx.temp_path, fs_ec.message());
    }

    if (ec == DownloadErrc::cancelled) {
        spdlog::log(ctx.info_level, "Download of {} cancelled", ctx.request.url);
    } else {
        spdlog::error("Download of {} failed ({}): {}", ctx.request.url, kind_name(ec), ec.message());
    }
}

void DownloadEngine::transition(Context& ctx, DownloadState next) noexcept {
    spdlog::debug("{}: {} -> {}", ctx.request.destination, to_string(ctx.state), to_string(next));
    ctx.state = next;
    if (state_callback_) {
        state_callback_(next);
    }
}

} // namespace surge::core
