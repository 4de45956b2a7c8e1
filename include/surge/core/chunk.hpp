// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace surge::core {

// Inclusive byte range [start, end] of the remote resource
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t length() const noexcept { return end - start + 1; }

    // Value for the Range request header: "bytes=<start>-<end>"
    [[nodiscard]] std::string header_value() const;

    // Value for libcurl's CURLOPT_RANGE: "<start>-<end>"
    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const ByteRange&) const = default;
};

// One attempt at one range. A retry creates a new job with attempt + 1.
struct ChunkJob {
    ByteRange range;
    std::uint32_t attempt{0};
};

struct ChunkResult {
    ByteRange range;
    std::uint64_t bytes_written{0};
    std::uint32_t attempts{0};
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

struct ChunkPlan {
    bool single_stream{true};       // Too small (or size unknown) to split
    std::uint64_t worker_share{0};  // max(total / workers, min_chunk_size)
    std::vector<ByteRange> ranges;  // Empty when single_stream
};

// Split [0, total_size) into consecutive ranges of chunk_size bytes; the last
// range is clamped to total_size - 1. Returns no ranges when total_size is 0.
[[nodiscard]] std::vector<ByteRange> partition_ranges(std::uint64_t total_size,
                                                      std::uint64_t chunk_size);

// Plans a parallel download, or signals single-stream when
// total_size <= 2 * min_chunk_size.
[[nodiscard]] ChunkPlan plan_chunks(std::uint64_t total_size,
                                    std::uint32_t worker_count,
                                    std::uint64_t min_chunk_size);

} // namespace surge::core
