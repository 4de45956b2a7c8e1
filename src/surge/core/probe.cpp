// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/probe.hpp>
#include <spdlog/spdlog.h>

namespace surge::core {

std::expected<ProbeResult, std::error_code>
Prober::probe(const DownloadRequest& request) noexcept {
    auto http = make_http_request(request);
    if (!http) {
        return std::unexpected(http.error());
    }
    return probe(*http);
}

std::expected<ProbeResult, std::error_code>
Prober::probe(const HttpRequest& request) noexcept {
    HttpRequest head_request = request;
    head_request.range.reset();

    auto response = transport_.head(head_request);

    ProbeResult result;
    if (!response) {
        const auto& ec = response.error();
        if (ec == DownloadErrc::dns_error) {
            return std::unexpected(make_error_code(DownloadErrc::probe_failed));
        }
        if (ec == DownloadErrc::invalid_url || ec == DownloadErrc::unsupported_scheme) {
            return std::unexpected(ec);
        }
        spdlog::warn("Probe of {} failed ({}), falling back to a single stream",
                     request.url, ec.message());
        result.degraded_by = ec;
        return result;
    }

    result.status_code = response->status_code;
    if (!response->is_success()) {
        spdlog::warn("Probe of {} returned HTTP {}, falling back to a single stream",
                     request.url, response->status_code);
        return result;
    }

    result.total_size = response->content_length;
    result.supports_range = response->accepts_ranges;
    result.content_type = response->content_type;
    result.filename = response->filename;

    spdlog::debug("Probe {}: status={} size={} ranges={}",
                  request.url,
                  result.status_code,
                  result.total_size ? std::to_string(*result.total_size) : "unknown",
                  result.supports_range);
    return result;
}

} // namespace surge::core
