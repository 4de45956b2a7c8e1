// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>

namespace surge::core {

enum class DownloadErrc {
    success = 0,
    invalid_url,
    unsupported_scheme,
    probe_failed,
    network_error,
    timeout,
    ssl_error,
    dns_error,
    connection_lost,
    too_many_redirects,
    short_body,
    range_mismatch,
    unexpected_full_response,
    invalid_request,
    invalid_settings,
    cancelled,
};

// Broad failure classes used for retry policy and caller presentation.
enum class ErrorKind {
    probe = 1,
    transport,
    http_status,
    write,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                  return "Success";
            case DownloadErrc::invalid_url:              return "Invalid URL";
            case DownloadErrc::unsupported_scheme:       return "Unsupported URL scheme";
            case DownloadErrc::probe_failed:             return "Could not reach host";
            case DownloadErrc::network_error:            return "Network error";
            case DownloadErrc::timeout:                  return "Operation timed out";
            case DownloadErrc::ssl_error:                return "SSL/TLS error";
            case DownloadErrc::dns_error:                return "DNS resolution failed";
            case DownloadErrc::connection_lost:          return "Connection lost";
            case DownloadErrc::too_many_redirects:       return "Too many redirects";
            case DownloadErrc::short_body:               return "Response body ended early";
            case DownloadErrc::range_mismatch:           return "Server returned a different byte range";
            case DownloadErrc::unexpected_full_response: return "Server ignored the byte range";
            case DownloadErrc::invalid_request:          return "Invalid download request";
            case DownloadErrc::invalid_settings:         return "Invalid settings file";
            case DownloadErrc::cancelled:                return "Download cancelled";
            default:                                     return "Unknown error";
        }
    }
};

// Error values in this category are the HTTP status code itself.
struct HttpStatusCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::http";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

struct ErrorKindCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::kind";
    }

    [[nodiscard]] std::string message(int ev) const override;

    [[nodiscard]] bool equivalent(const std::error_code& code, int condition) const noexcept override;
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline const detail::HttpStatusCategory& http_status_category() noexcept {
    static detail::HttpStatusCategory category;
    return category;
}

inline const detail::ErrorKindCategory& error_kind_category() noexcept {
    static detail::ErrorKindCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), error_kind_category()};
}

// Error carrying an unexpected HTTP status, e.g. 404 or 503.
// A status of 0 or less means no status line was received; report it as a
// network failure so the result is never a falsy error_code.
inline std::error_code make_http_error(int status) noexcept {
    if (status <= 0) {
        return make_error_code(DownloadErrc::network_error);
    }
    return {status, http_status_category()};
}

// Chunk-level retry applies to transport and HTTP status failures only.
[[nodiscard]] bool is_retryable(const std::error_code& ec) noexcept;

[[nodiscard]] std::string_view kind_name(const std::error_code& ec) noexcept;

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::DownloadErrc> : true_type {};

template<>
struct is_error_condition_enum<surge::core::ErrorKind> : true_type {};

} // namespace std
