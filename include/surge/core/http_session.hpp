// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/chunk.hpp>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace surge::core {

// Parsed "Content-Range: bytes <start>-<end>/<total>" (total may be '*')
struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total;
};

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

struct HttpRequest {
    std::string url;
    std::string user_agent;
    std::string referer;
    std::optional<ByteRange> range;
    std::chrono::seconds timeout{60};  // Connect and stall timeout, not a whole-transfer limit
};

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lowercase names
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range;
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename; // From Content-Disposition

    [[nodiscard]] bool is_success() const noexcept { return status_code >= 200 && status_code < 300; }
};

// Inspects the response once its headers are complete, before the first body
// byte is delivered. A non-empty error aborts the transfer with that error.
using ResponseHandler = std::function<std::error_code(const HttpResponse&)>;

enum class SinkAction { proceed, stop };

// Receives body bytes in bounded pieces. SinkAction::stop ends the transfer
// early without an error (the sink records its own reason).
using BodySink = std::function<SinkAction(const std::byte* data, std::size_t size)>;

// Transport used by the probe, the chunk fetchers and the single-stream path.
// Implementations must be safe to call from several worker threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept = 0;

    // Stop requests are observed at least once per delivered buffer and yield
    // DownloadErrc::cancelled.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const ResponseHandler& on_response,
        const BodySink& sink,
        std::stop_token stop) noexcept = 0;
};

// libcurl transport. The DNS cache and TLS sessions are shared between all
// transfers issued through one session. Connections are not: libcurl does not
// support a connection cache shared by concurrent threads, so every transfer
// opens its own.
class HttpSession final : public HttpTransport {
public:
    HttpSession();
    ~HttpSession() override;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept;
    HttpSession& operator=(HttpSession&&) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const ResponseHandler& on_response,
        const BodySink& sink,
        std::stop_token stop) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition) noexcept;

private:
    struct Share;
    std::unique_ptr<Share> share_;
};

} // namespace surge::core
