// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_request.hpp>
#include <surge/core/url.hpp>

namespace surge::core {

std::error_code DownloadRequest::validate() const noexcept {
    if (destination.empty()) {
        return make_error_code(DownloadErrc::invalid_request);
    }
    if (worker_count == 0 || worker_count > MAX_WORKERS) {
        return make_error_code(DownloadErrc::invalid_request);
    }
    if (min_chunk_size == 0 || max_chunk_retries == 0) {
        return make_error_code(DownloadErrc::invalid_request);
    }
    if (attempt_timeout.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_request);
    }
    return {};
}

std::expected<HttpRequest, std::error_code>
make_http_request(const DownloadRequest& request) noexcept {
    auto url = Url::parse(request.url);
    if (!url) {
        return std::unexpected(url.error());
    }
    if (!url->is_http()) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_scheme));
    }

    HttpRequest http;
    http.url = url->full();
    http.user_agent = request.user_agent ? *request.user_agent : std::string(DEFAULT_USER_AGENT);

    // Hosts that check Referer expect the listing page the file was linked from
    http.referer = request.referer ? *request.referer : url->parent_directory();
    http.timeout = request.attempt_timeout;
    return http;
}

} // namespace surge::core
