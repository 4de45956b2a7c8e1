// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk.hpp>
#include <surge/core/http_session.hpp>
#include <surge/disk/file_writer.hpp>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace surge::core {

// (chunk_start, bytes_written_this_attempt)
using ChunkProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

// Downloads one byte range with a single ranged GET, writing each buffer at its
// final offset in the shared output file. One attempt only; retry policy lives
// in ChunkScheduler.
//
// Accepted responses:
//   206 whose Content-Range equals the requested range (or, without a
//       Content-Range, whose Content-Length equals the range length);
//   200 for the chunk starting at offset 0, truncated to the range length.
// Anything else fails with range_mismatch, unexpected_full_response, or an
// http_status_category() code.
class ChunkFetcher {
public:
    ChunkFetcher(HttpTransport& transport,
                 HttpRequest base,
                 disk::FileWriter& file,
                 ChunkProgressFn on_progress);

    // Safe to call concurrently for disjoint ranges
    [[nodiscard]] std::error_code fetch(const ByteRange& range, std::stop_token stop) const noexcept;

private:
    HttpTransport& transport_;
    HttpRequest base_;
    disk::FileWriter& file_;
    ChunkProgressFn on_progress_;
};

} // namespace surge::core
