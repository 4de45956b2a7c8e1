// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/download_request.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/settings.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace surge::cli {

// Exit status (or error) of a command
using CliResult = std::expected<int, std::error_code>;

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;
constexpr int EXIT_CANCELLED = 130;  // 128 + SIGINT

// Command line arguments; unset optionals fall back to the settings file,
// then to the built-in defaults
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_file;
    std::optional<std::uint32_t> workers;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint32_t> retries;
    std::optional<std::uint32_t> timeout_sec;
    std::optional<std::uint32_t> attempts;
    std::optional<std::string> referer;
    std::optional<std::string> user_agent;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when the command line is invalid
};

// Everything needed to run one URL to completion
struct DownloadJob {
    core::DownloadRequest request;
    std::uint32_t attempts{core::DEFAULT_DOWNLOAD_ATTEMPTS};
    std::chrono::seconds retry_delay{core::DEFAULT_RETRY_DELAY};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, const char* const argv[]) noexcept;

// Destination for `url`: -o when given (single URL), otherwise the decoded
// file name from the URL, placed under -d. Empty when no name can be derived.
[[nodiscard]] std::string output_path_for(const CliArgs& args, const std::string& url);

// Merge defaults, settings file and flags (in that order of precedence)
[[nodiscard]] DownloadJob make_job(const CliArgs& args,
                                   const core::Settings& settings,
                                   const std::string& url,
                                   const std::string& destination);

// Install the "surge" stderr logger as the default spdlog logger
void setup_logging(bool verbose, bool quiet, const std::optional<std::string>& level);

// Download one URL, retrying the whole download up to job.attempts times
[[nodiscard]] CliResult download(core::HttpTransport& transport,
                                 const DownloadJob& job,
                                 bool show_progress,
                                 std::stop_token stop) noexcept;

// Probe only: print size, range support and content type
[[nodiscard]] CliResult info(core::HttpTransport& transport, const core::DownloadRequest& request) noexcept;

// Whole program; returns the process exit status
[[nodiscard]] int run(const CliArgs& args, std::stop_token stop) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace surge::cli
