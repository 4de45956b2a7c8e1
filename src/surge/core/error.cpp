// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <string>

namespace surge::core {

namespace detail {

std::string HttpStatusCategory::message(int ev) const {
    switch (ev) {
        case 400: return "HTTP 400 Bad Request";
        case 401: return "HTTP 401 Unauthorized";
        case 403: return "HTTP 403 Forbidden";
        case 404: return "HTTP 404 Not Found";
        case 416: return "HTTP 416 Range Not Satisfiable";
        case 429: return "HTTP 429 Too Many Requests";
        case 500: return "HTTP 500 Internal Server Error";
        case 502: return "HTTP 502 Bad Gateway";
        case 503: return "HTTP 503 Service Unavailable";
        case 504: return "HTTP 504 Gateway Timeout";
        default:  return "HTTP " + std::to_string(ev);
    }
}

std::string ErrorKindCategory::message(int ev) const {
    switch (static_cast<ErrorKind>(ev)) {
        case ErrorKind::probe:       return "Probe error";
        case ErrorKind::transport:   return "Transport error";
        case ErrorKind::http_status: return "HTTP status error";
        case ErrorKind::write:       return "Write error";
        case ErrorKind::cancelled:   return "Cancelled";
        default:                     return "Unknown error kind";
    }
}

bool ErrorKindCategory::equivalent(const std::error_code& code, int condition) const noexcept {
    const auto kind = static_cast<ErrorKind>(condition);

    if (code.category() == http_status_category()) {
        return kind == ErrorKind::http_status;
    }
    if (code.category() == disk::disk_errc_category()) {
        return kind == ErrorKind::write && code.value() != 0;
    }
    if (code.category() != download_errc_category()) {
        return false;
    }

    switch (static_cast<DownloadErrc>(code.value())) {
        case DownloadErrc::invalid_url:
        case DownloadErrc::unsupported_scheme:
        case DownloadErrc::probe_failed:
            return kind == ErrorKind::probe;

        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::ssl_error:
        case DownloadErrc::dns_error:
        case DownloadErrc::connection_lost:
        case DownloadErrc::too_many_redirects:
        case DownloadErrc::short_body:
            return kind == ErrorKind::transport;

        case DownloadErrc::range_mismatch:
        case DownloadErrc::unexpected_full_response:
            return kind == ErrorKind::http_status;

        case DownloadErrc::cancelled:
            return kind == ErrorKind::cancelled;

        default:
            return false;
    }
}

} // namespace detail

bool is_retryable(const std::error_code& ec) noexcept {
    return ec == ErrorKind::transport || ec == ErrorKind::http_status;
}

std::string_view kind_name(const std::error_code& ec) noexcept {
    if (!ec) return "none";
    if (ec == ErrorKind::probe) return "probe";
    if (ec == ErrorKind::transport) return "transport";
    if (ec == ErrorKind::http_status) return "http_status";
    if (ec == ErrorKind::write) return "write";
    if (ec == ErrorKind::cancelled) return "cancelled";
    return "other";
}

} // namespace surge::core
