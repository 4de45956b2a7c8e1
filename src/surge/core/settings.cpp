// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/settings.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace surge::core {

namespace {

// False when the key is present with a value that does not fit T. Integer
// keys accept only non-negative whole numbers within T's range.
template<typename T>
[[nodiscard]] bool read_key(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    const auto& value = j[key];
    if constexpr (std::is_integral_v<T>) {
        if (!value.is_number_unsigned()
            || value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            spdlog::error("Invalid settings: {} must be a non-negative integer, got {}", key, value.dump());
            return false;
        }
    } else {
        if (!value.is_string()) {
            spdlog::error("Invalid settings: {} must be a string, got {}", key, value.dump());
            return false;
        }
    }
    out = value.get<T>();
    return true;
}

[[nodiscard]] bool read_seconds(const nlohmann::json& j, const char* key, std::optional<std::chrono::seconds>& out) {
    std::optional<std::uint32_t> value;
    if (!read_key(j, key, value)) {
        return false;
    }
    if (value) {
        out = std::chrono::seconds{*value};
    }
    return true;
}

// spdlog maps unknown names to "off", which would hide every error
[[nodiscard]] bool valid_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

std::expected<Settings, std::error_code> Settings::parse(std::string_view json) noexcept {
    const auto invalid = std::unexpected(make_error_code(DownloadErrc::invalid_settings));
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return invalid;
        }

        Settings settings;
        bool ok = read_key(j, "workers", settings.workers)
               && read_key(j, "min_chunk_size", settings.min_chunk_size)
               && read_key(j, "max_chunk_retries", settings.max_chunk_retries)
               && read_seconds(j, "timeout_sec", settings.timeout)
               && read_key(j, "user_agent", settings.user_agent)
               && read_key(j, "referer", settings.referer)
               && read_key(j, "download_attempts", settings.download_attempts)
               && read_seconds(j, "retry_delay_sec", settings.retry_delay)
               && read_key(j, "log_level", settings.log_level);
        if (!ok) {
            return invalid;
        }

        if (settings.log_level && !valid_log_level(*settings.log_level)) {
            spdlog::error("Invalid settings: unknown log_level \"{}\"", *settings.log_level);
            return invalid;
        }
        return settings;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid settings: {}", e.what());
        return invalid;
    }
}

std::expected<Settings, std::error_code> Settings::load(const std::string& path) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno;
        return std::unexpected(err != 0 ? disk::from_errno(err)
                                        : disk::make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto settings = parse(buffer.str());
    if (!settings) {
        spdlog::error("Could not load settings from {}", path);
    }
    return settings;
}

void Settings::apply(DownloadRequest& request) const {
    if (workers) request.worker_count = *workers;
    if (min_chunk_size) request.min_chunk_size = *min_chunk_size;
    if (max_chunk_retries) request.max_chunk_retries = *max_chunk_retries;
    if (timeout) request.attempt_timeout = *timeout;
    if (user_agent) request.user_agent = *user_agent;
    if (referer) request.referer = *referer;
}

} // namespace surge::core
