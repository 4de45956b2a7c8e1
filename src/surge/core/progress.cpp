// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/progress.hpp>
#include <utility>

namespace surge::core {

//=============================================================================
// ProgressAggregator
//=============================================================================

void ProgressAggregator::report(std::uint64_t chunk_start, std::uint64_t bytes_so_far) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[chunk_start] = bytes_so_far;
}

std::uint64_t ProgressAggregator::total() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t sum = 0;
    for (const auto& [start, bytes] : chunks_) {
        sum += bytes;
    }
    return sum;
}

std::uint64_t ProgressAggregator::chunk(std::uint64_t chunk_start) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(chunk_start);
    return it == chunks_.end() ? 0 : it->second;
}

std::size_t ProgressAggregator::chunk_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

//=============================================================================
// ProgressThrottle
//=============================================================================

ProgressThrottle::ProgressThrottle(ProgressCallback callback,
                                   std::uint64_t total_bytes,
                                   std::chrono::milliseconds interval) noexcept
    : callback_(std::move(callback))
    , total_(total_bytes)
    , interval_(interval) {}

void ProgressThrottle::update(std::uint64_t downloaded, clock::time_point now) {
    if (finished_) return;

    // A chunk retry can shrink the aggregate total; hold the last value instead
    if (downloaded <= last_emitted_) return;

    if (emissions_ > 0 && now - last_emit_time_ < interval_) return;

    emit(downloaded, now);
}

void ProgressThrottle::finish() {
    if (finished_) return;
    emit(total_, clock::now());
    finished_ = true;
}

void ProgressThrottle::emit(std::uint64_t downloaded, clock::time_point now) {
    last_emitted_ = downloaded;
    last_emit_time_ = now;
    ++emissions_;
    if (callback_) {
        callback_(downloaded, total_);
    }
}

} // namespace surge::core
