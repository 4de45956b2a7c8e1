// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/http_session.hpp>
#include <surge/core/download_request.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace surge::core {

// What the server told us about the resource before any body transfer
struct ProbeResult {
    std::optional<std::uint64_t> total_size;  // Unknown when the HEAD degraded
    bool supports_range{false};
    std::int32_t status_code{0};              // 0 when the HEAD itself failed
    std::string content_type;
    std::string filename;                     // From Content-Disposition
    std::error_code degraded_by;              // Transport error that forced the fallback

    [[nodiscard]] bool can_split() const noexcept {
        return supports_range && total_size && *total_size > 0;
    }
};

// HEAD-based capability probe.
//
// Only malformed URLs, non-HTTP schemes and unresolvable hosts are errors.
// Every other failure (transport error, non-2xx status, missing headers)
// degrades to "no range support, unknown size" so the caller can still try a
// plain GET.
class Prober {
public:
    explicit Prober(HttpTransport& transport) noexcept : transport_(transport) {}

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const DownloadRequest& request) noexcept;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const HttpRequest& request) noexcept;

private:
    HttpTransport& transport_;
};

} // namespace surge::core
