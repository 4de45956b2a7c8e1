// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace surge::core {

constexpr std::uint32_t DEFAULT_WORKERS = 4;                        // Few connections to avoid rate limiting
constexpr std::uint32_t MAX_WORKERS = 32;
constexpr std::uint64_t DEFAULT_MIN_CHUNK_SIZE = 4 * 1024 * 1024;   // 4 MB
constexpr std::uint32_t DEFAULT_CHUNK_ATTEMPTS = 3;

constexpr std::chrono::seconds DEFAULT_ATTEMPT_TIMEOUT{60};
constexpr std::chrono::milliseconds DEFAULT_BACKOFF_UNIT{1000};     // attempt 1 waits 1s, attempt 2 waits 2s
constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{1000};
constexpr std::chrono::milliseconds PROGRESS_POLL_INTERVAL{100};

constexpr std::uint32_t DEFAULT_DOWNLOAD_ATTEMPTS = 1;
constexpr std::chrono::seconds DEFAULT_RETRY_DELAY{2};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB per chunk transfer
constexpr std::size_t STREAM_BUFFER_SIZE = 1024 * 1024;             // 1 MB single-stream write buffer

constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::string_view TEMP_SUFFIX = ".tmp";

// Some archive hosts reject library user agents outright.
constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/140.0.0.0 Safari/537.36";

} // namespace surge::core
