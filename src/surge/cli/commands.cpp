// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <surge/core/chunk_scheduler.hpp>
#include <surge/core/download_engine.hpp>
#include <surge/core/error.hpp>
#include <surge/core/probe.hpp>
#include <surge/core/url.hpp>
#include <surge/version.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <utility>

using namespace surge::core;

namespace fs = std::filesystem;

namespace surge::cli {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Initializes libcurl for the lifetime of the command
struct CurlGlobal {
    CurlGlobal() { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Failures that another attempt cannot fix
bool worth_retrying(const std::error_code& ec) noexcept {
    if (ec == ErrorKind::cancelled || ec == ErrorKind::write) {
        return false;
    }
    return ec != DownloadErrc::invalid_url
        && ec != DownloadErrc::unsupported_scheme
        && ec != DownloadErrc::invalid_request;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, const char* const argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Options that take a value
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 < argc) {
                return std::string_view(argv[++i]);
            }
            args.error = fmt::format("Missing value for {}", arg);
            return std::nullopt;
        };

        auto number = [&]<typename T>(std::optional<T>& out) {
            auto text = value();
            if (!text) return;
            out = parse_number<T>(*text);
            if (!out || *out == 0) {
                out.reset();
                args.error = fmt::format("Invalid value for {}: {}", arg, *text);
            }
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value()) args.output_file = *v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value()) args.output_dir = *v;
        } else if (arg == "--config") {
            if (auto v = value()) args.config_file = *v;
        } else if (arg == "--referer") {
            if (auto v = value()) args.referer = std::string(*v);
        } else if (arg == "--user-agent") {
            if (auto v = value()) args.user_agent = std::string(*v);
        } else if (arg == "-n" || arg == "--workers") {
            number(args.workers);
        } else if (arg == "-c" || arg == "--chunk-size") {
            number(args.chunk_size);
        } else if (arg == "-r" || arg == "--retries") {
            number(args.retries);
        } else if (arg == "-t" || arg == "--timeout") {
            number(args.timeout_sec);
        } else if (arg == "-a" || arg == "--attempts") {
            number(args.attempts);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = fmt::format("Unknown option: {}", arg);
        } else {
            args.urls.emplace_back(arg);
        }

        if (!args.error.empty()) {
            return args;
        }
    }

    return args;
}

std::string output_path_for(const CliArgs& args, const std::string& url) {
    fs::path path;

    if (!args.output_file.empty() && args.urls.size() <= 1) {
        path = args.output_file;
    } else {
        auto parsed = Url::parse(url);
        if (!parsed) {
            return {};
        }
        auto name = Url::decode(parsed->filename());
        std::replace(name.begin(), name.end(), '/', '_');
        if (name.empty() || name == "." || name == "..") {
            return {};
        }
        path = name;
    }

    if (!args.output_dir.empty() && path.is_relative()) {
        path = fs::path(args.output_dir) / path;
    }
    return path.string();
}

DownloadJob make_job(const CliArgs& args,
                     const Settings& settings,
                     const std::string& url,
                     const std::string& destination) {
    DownloadJob job;
    job.request.url = url;
    job.request.destination = destination;
    job.request.quiet = args.quiet;

    settings.apply(job.request);
    if (settings.download_attempts) job.attempts = *settings.download_attempts;
    if (settings.retry_delay) job.retry_delay = *settings.retry_delay;

    if (args.workers) job.request.worker_count = *args.workers;
    if (args.chunk_size) job.request.min_chunk_size = *args.chunk_size;
    if (args.retries) job.request.max_chunk_retries = *args.retries;
    if (args.timeout_sec) job.request.attempt_timeout = std::chrono::seconds{*args.timeout_sec};
    if (args.attempts) job.attempts = *args.attempts;
    if (args.referer) job.request.referer = args.referer;
    if (args.user_agent) job.request.user_agent = args.user_agent;

    if (job.request.worker_count > MAX_WORKERS) {
        spdlog::warn("Limiting workers to {}", MAX_WORKERS);
        job.request.worker_count = MAX_WORKERS;
    }
    if (job.attempts == 0) {
        job.attempts = 1;
    }
    return job;
}

void setup_logging(bool verbose, bool quiet, const std::optional<std::string>& level) {
    auto logger = spdlog::get("surge");
    if (!logger) {
        logger = spdlog::stderr_color_mt("surge");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (level) {
        spdlog::set_level(spdlog::level::from_str(*level));
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(HttpTransport& transport,
                   const DownloadJob& job,
                   bool show_progress,
                   std::stop_token stop) noexcept {
    DownloadEngine engine(transport);
    const auto label = fs::path(job.request.destination).filename().string();

    if (show_progress) {
        fmt::print("Downloading: {}\n", label);
    }

    for (std::uint32_t attempt = 1;; ++attempt) {
        if (job.attempts > 1) {
            spdlog::info("Attempt {}/{}", attempt, job.attempts);
        }

        ProgressBar bar(label);
        ProgressCallback on_progress;
        if (show_progress) {
            on_progress = [&bar](std::uint64_t downloaded, std::uint64_t total) {
                bar.update(downloaded, total);
            };
        }

        auto result = engine.download(job.request, on_progress, stop);
        if (result) {
            if (result->strategy == DownloadStrategy::already_present) {
                if (show_progress) fmt::print("File already exists: {}\n", job.request.destination);
            } else if (show_progress) {
                bar.finish();
                fmt::print("Saved to: {}\n", job.request.destination);
            }
            return EXIT_OK;
        }

        bar.clear();
        const auto& ec = result.error();
        if (ec == ErrorKind::cancelled) {
            fmt::print(stderr, "Download cancelled\n");
            return EXIT_CANCELLED;
        }
        if (!worth_retrying(ec) || attempt >= job.attempts) {
            fmt::print(stderr, "Error: {}\n", ec.message());
            return std::unexpected(ec);
        }

        spdlog::warn("Failed: {}, retrying in {}s", ec.message(), job.retry_delay.count());
        if (!backoff_wait(std::chrono::duration_cast<std::chrono::milliseconds>(job.retry_delay), stop)) {
            fmt::print(stderr, "Download cancelled\n");
            return EXIT_CANCELLED;
        }
    }
}

CliResult info(HttpTransport& transport, const DownloadRequest& request) noexcept {
    auto probe = Prober(transport).probe(request);
    if (!probe) {
        fmt::print(stderr, "Error: {}: {}\n", request.url, probe.error().message());
        return std::unexpected(probe.error());
    }

    fmt::print("URL: {}\n", request.url);
    if (probe->degraded_by) {
        fmt::print("Status: unreachable ({})\n", probe->degraded_by.message());
    } else {
        fmt::print("Status: {}\n", probe->status_code);
    }
    if (probe->total_size) {
        fmt::print("Size: {} ({} bytes)\n", ProgressBar::format_bytes(*probe->total_size), *probe->total_size);
    } else {
        fmt::print("Size: unknown\n");
    }
    fmt::print("Accepts-Ranges: {}\n", probe->supports_range ? "yes" : "no");
    if (!probe->content_type.empty()) {
        fmt::print("Content-Type: {}\n", probe->content_type);
    }
    if (!probe->filename.empty()) {
        fmt::print("Filename: {}\n", probe->filename);
    }
    return EXIT_OK;
}

int run(const CliArgs& args, std::stop_token stop) noexcept {
    Settings settings;
    if (!args.config_file.empty()) {
        auto loaded = Settings::load(args.config_file);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot load {}: {}\n", args.config_file, loaded.error().message());
            return EXIT_FAILURE_STATUS;
        }
        settings = std::move(*loaded);
    }

    setup_logging(args.verbose, args.quiet, settings.log_level);

    if (args.urls.empty()) {
        fmt::print(stderr, "Error: No URL specified\nUse -h for help\n");
        return EXIT_FAILURE_STATUS;
    }

    CurlGlobal curl;
    HttpSession session;

    if (args.info) {
        int exit_code = EXIT_OK;
        for (const auto& url : args.urls) {
            auto job = make_job(args, settings, url, {});
            if (!info(session, job.request)) {
                exit_code = EXIT_FAILURE_STATUS;
            }
        }
        return exit_code;
    }

    int exit_code = EXIT_OK;
    for (const auto& url : args.urls) {
        auto destination = output_path_for(args, url);
        if (destination.empty()) {
            fmt::print(stderr, "Error: cannot determine a file name from {}, use -o\n", url);
            exit_code = EXIT_FAILURE_STATUS;
            continue;
        }

        auto job = make_job(args, settings, url, destination);
        auto result = download(session, job, !args.quiet, stop);
        if (!result) {
            exit_code = EXIT_FAILURE_STATUS;
        } else if (*result == EXIT_CANCELLED) {
            return EXIT_CANCELLED;
        }
    }
    return exit_code;
}

void print_help(std::string_view program_name) noexcept {
    fmt::print("Surge {} - parallel range downloader\n", surge::version_string());
    fmt::print("\n");
    fmt::print("USAGE:\n");
    fmt::print("  {} [OPTIONS] <URL>...\n", program_name);
    fmt::print("\n");
    fmt::print("OPTIONS:\n");
    fmt::print("  -h, --help              Show this help message\n");
    fmt::print("  -v, --version           Show version information\n");
    fmt::print("  -V, --verbose           Enable debug logging\n");
    fmt::print("  -q, --quiet             Quiet mode (no progress bar)\n");
    fmt::print("  -o, --output <FILE>     Save to specified file\n");
    fmt::print("  -d, --directory <DIR>   Save to specified directory\n");
    fmt::print("  -n, --workers <N>       Parallel connections (default: {})\n", DEFAULT_WORKERS);
    fmt::print("  -c, --chunk-size <B>    Minimum chunk size in bytes (default: {})\n", DEFAULT_MIN_CHUNK_SIZE);
    fmt::print("  -r, --retries <N>       Attempts per chunk (default: {})\n", DEFAULT_CHUNK_ATTEMPTS);
    fmt::print("  -t, --timeout <SEC>     Connect/stall timeout (default: {})\n", DEFAULT_ATTEMPT_TIMEOUT.count());
    fmt::print("  -a, --attempts <N>      Whole-download attempts (default: {})\n", DEFAULT_DOWNLOAD_ATTEMPTS);
    fmt::print("      --referer <URL>     Referer header (default: parent directory of URL)\n");
    fmt::print("      --user-agent <UA>   User-Agent header\n");
    fmt::print("      --config <FILE>     JSON settings file\n");
    fmt::print("  -i, --info              Show file info without downloading\n");
    fmt::print("\n");
    fmt::print("EXAMPLES:\n");
    fmt::print("  {} https://example.com/files/game.zip\n", program_name);
    fmt::print("  {} -o /roms/game.zip https://example.com/files/game.zip\n", program_name);
    fmt::print("  {} -n 8 -a 3 https://example.com/large.iso\n", program_name);
}

void print_version() noexcept {
    fmt::print("Surge {}\n", surge::version_string());
    fmt::print("Built {} with C++23, {}\n", surge::BUILD_DATE, curl_version());
}

} // namespace surge::cli
