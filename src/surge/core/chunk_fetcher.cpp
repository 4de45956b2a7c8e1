// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace surge::core {

ChunkFetcher::ChunkFetcher(HttpTransport& transport,
                           HttpRequest base,
                           disk::FileWriter& file,
                           ChunkProgressFn on_progress)
    : transport_(transport)
    , base_(std::move(base))
    , file_(file)
    , on_progress_(std::move(on_progress)) {}

std::error_code ChunkFetcher::fetch(const ByteRange& range, std::stop_token stop) const noexcept {
    HttpRequest request = base_;
    request.range = range;

    const std::uint64_t expected = range.length();
    std::uint64_t written = 0;
    bool whole_body = false;
    bool overflow = false;
    std::error_code write_error;

    ResponseHandler on_response = [&](const HttpResponse& response) -> std::error_code {
        if (response.status_code == 206) {
            if (response.content_range) {
                if (response.content_range->start != range.start
                    || response.content_range->end != range.end) {
                    return make_error_code(DownloadErrc::range_mismatch);
                }
            } else if (!response.content_length || *response.content_length != expected) {
                return make_error_code(DownloadErrc::range_mismatch);
            }
            return {};
        }
        if (response.status_code == 200) {
            // Range ignored: the body starts at byte 0, usable only for the first chunk
            if (range.start != 0) {
                return make_error_code(DownloadErrc::unexpected_full_response);
            }
            whole_body = true;
            return {};
        }
        return make_http_error(response.status_code);
    };

    BodySink sink = [&](const std::byte* data, std::size_t size) -> SinkAction {
        const std::uint64_t remaining = expected - written;
        if (size > remaining) {
            if (!whole_body) {
                overflow = true;
                return SinkAction::stop;
            }
            size = static_cast<std::size_t>(remaining);
        }

        if (size > 0) {
            write_error = file_.write(range.start + written, data, size);
            if (write_error) {
                return SinkAction::stop;
            }
            written += size;
            if (on_progress_) {
                on_progress_(range.start, written);
            }
        }

        // Rest of a full-body 200 belongs to other chunks
        if (whole_body && written == expected) {
            return SinkAction::stop;
        }
        return SinkAction::proceed;
    };

    auto response = transport_.get(request, on_response, sink, stop);

    if (write_error) {
        return write_error;
    }
    if (overflow) {
        return make_error_code(DownloadErrc::range_mismatch);
    }
    if (!response) {
        return response.error();
    }
    if (written < expected) {
        spdlog::debug("Chunk {} ended after {} of {} bytes", range.to_string(), written, expected);
        return make_error_code(DownloadErrc::short_body);
    }
    return {};
}

} // namespace surge::core
