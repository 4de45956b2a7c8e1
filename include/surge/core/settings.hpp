// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/download_request.hpp>
#include <surge/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace surge::core {

// Downloader defaults read from a JSON settings file:
//
//   {
//     "workers": 4,
//     "min_chunk_size": 4194304,
//     "max_chunk_retries": 3,
//     "timeout_sec": 60,
//     "user_agent": "...",
//     "referer": "https://example.org/files/",
//     "download_attempts": 3,
//     "retry_delay_sec": 2,
//     "log_level": "info"
//   }
//
// Every key is optional; unknown keys are ignored.
struct Settings {
    std::optional<std::uint32_t> workers;
    std::optional<std::uint64_t> min_chunk_size;
    std::optional<std::uint32_t> max_chunk_retries;
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::string> user_agent;
    std::optional<std::string> referer;
    std::optional<std::uint32_t> download_attempts;
    std::optional<std::chrono::seconds> retry_delay;
    std::optional<std::string> log_level;

    // Parse a JSON document; invalid_settings on syntax or type errors
    [[nodiscard]] static std::expected<Settings, std::error_code> parse(std::string_view json) noexcept;

    // Read and parse a file; disk errors if it cannot be read
    [[nodiscard]] static std::expected<Settings, std::error_code> load(const std::string& path) noexcept;

    // Copy every present value onto the request
    void apply(DownloadRequest& request) const;
};

} // namespace surge::core
