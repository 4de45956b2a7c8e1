// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace surge::core {

std::string ByteRange::header_value() const {
    return fmt::format("bytes={}-{}", start, end);
}

std::string ByteRange::to_string() const {
    return fmt::format("{}-{}", start, end);
}

std::vector<ByteRange> partition_ranges(std::uint64_t total_size, std::uint64_t chunk_size) {
    std::vector<ByteRange> ranges;
    if (total_size == 0) {
        return ranges;
    }
    if (chunk_size == 0) {
        chunk_size = total_size;
    }

    ranges.reserve(static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size));
    for (std::uint64_t start = 0; start < total_size; start += chunk_size) {
        std::uint64_t end = std::min(start + chunk_size - 1, total_size - 1);
        ranges.push_back(ByteRange{start, end});
        if (end == total_size - 1) {
            break;  // Guards start + chunk_size overflow near UINT64_MAX
        }
    }
    return ranges;
}

ChunkPlan plan_chunks(std::uint64_t total_size,
                      std::uint32_t worker_count,
                      std::uint64_t min_chunk_size) {
    ChunkPlan plan;
    if (worker_count == 0) {
        worker_count = 1;
    }
    plan.worker_share = std::max(total_size / worker_count, min_chunk_size);

    // Parallelism only pays off above two minimum-size chunks
    if (total_size == 0 || min_chunk_size == 0 || total_size <= 2 * min_chunk_size) {
        return plan;
    }

    plan.single_stream = false;
    plan.ranges = partition_ranges(total_size, min_chunk_size);
    return plan;
}

} // namespace surge::core
