// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/error.hpp>
#include <surge/core/http_session.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace surge::core {

// Everything one download() call needs. Treated as immutable once the
// download starts.
struct DownloadRequest {
    std::string url;
    std::string destination;

    std::uint32_t worker_count{DEFAULT_WORKERS};
    std::uint64_t min_chunk_size{DEFAULT_MIN_CHUNK_SIZE};
    std::uint32_t max_chunk_retries{DEFAULT_CHUNK_ATTEMPTS};  // Total attempts per chunk
    std::chrono::seconds attempt_timeout{DEFAULT_ATTEMPT_TIMEOUT};

    std::optional<std::string> referer;     // Inferred from the URL when unset
    std::optional<std::string> user_agent;  // DEFAULT_USER_AGENT when unset

    bool quiet{false};

    std::chrono::milliseconds backoff_unit{DEFAULT_BACKOFF_UNIT};
    std::chrono::milliseconds progress_interval{DEFAULT_PROGRESS_INTERVAL};

    [[nodiscard]] std::string temp_path() const { return destination + std::string(TEMP_SUFFIX); }

    // invalid_request for empty destination or zero workers/chunk size/attempts
    [[nodiscard]] std::error_code validate() const noexcept;
};

// Base request (URL, headers, timeout) shared by the probe, the chunk fetchers
// and the single-stream path. Fails with invalid_url or unsupported_scheme.
[[nodiscard]] std::expected<HttpRequest, std::error_code>
make_http_request(const DownloadRequest& request) noexcept;

} // namespace surge::core
