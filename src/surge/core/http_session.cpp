// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/http_session.hpp>
#include <surge/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string>

namespace surge::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const char* header) noexcept {
        if (auto* next = curl_slist_append(ptr, header)) {
            ptr = next;
        }
    }
};

// State of one curl_easy_perform call, shared with the callbacks
struct Transfer {
    CURL* curl{nullptr};
    HttpResponse response;
    const ResponseHandler* on_response{nullptr};
    const BodySink* sink{nullptr};
    std::stop_token stop;
    bool headers_done{false};
    bool sink_stopped{false};
    std::error_code handler_error;
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer) return total;

    std::string_view header(buffer, total);

    // Status line of a new response (redirect hop or 100-continue): drop old headers
    if (header.starts_with("HTTP/")) {
        transfer->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    transfer->response.headers[to_lower(name)] = std::string(value);
    return total;
}

void fill_response_fields(HttpResponse& response) {
    const auto& headers = response.headers;

    if (auto it = headers.find("content-length"); it != headers.end()) {
        response.content_length = parse_u64(it->second);
    }
    if (auto it = headers.find("content-range"); it != headers.end()) {
        response.content_range = parse_content_range(it->second);
    }
    if (auto it = headers.find("accept-ranges"); it != headers.end()) {
        response.accepts_ranges = to_lower(it->second).find("bytes") != std::string::npos;
    }
    if (auto it = headers.find("content-type"); it != headers.end()) {
        response.content_type = it->second;
    }
    if (auto it = headers.find("content-disposition"); it != headers.end()) {
        response.filename = HttpSession::parse_content_disposition(it->second);
    }
}

// Completes the response once and hands it to the caller's handler
bool deliver_headers(Transfer& transfer) {
    if (transfer.headers_done) {
        return !transfer.handler_error;
    }
    transfer.headers_done = true;

    long http_code = 0;
    curl_easy_getinfo(transfer.curl, CURLINFO_RESPONSE_CODE, &http_code);
    transfer.response.status_code = static_cast<std::int32_t>(http_code);
    fill_response_fields(transfer.response);

    if (transfer.on_response && *transfer.on_response) {
        transfer.handler_error = (*transfer.on_response)(transfer.response);
    }
    return !transfer.handler_error;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    std::size_t bytes = size * nmemb;

    // Returning a short count makes curl abort with CURLE_WRITE_ERROR
    if (transfer->stop.stop_requested()) {
        return 0;
    }
    if (!deliver_headers(*transfer)) {
        return 0;
    }
    if (transfer->sink && *transfer->sink) {
        auto action = (*transfer->sink)(reinterpret_cast<const std::byte*>(ptr), bytes);
        if (action == SinkAction::stop) {
            transfer->sink_stopped = true;
            return 0;
        }
    }
    return bytes;
}

// Aborts a stalled socket read promptly when cancellation is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    return transfer->stop.stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_URL_MALFORMAT:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::unsupported_scheme);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

//=============================================================================
// Content-Range
//=============================================================================

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    // bytes 0-499/1234  |  bytes 0-499/*
    constexpr std::string_view unit = "bytes ";
    if (!value.starts_with(unit)) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto start = parse_u64(value.substr(0, dash));
    auto end = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    ContentRange range{*start, *end, std::nullopt};
    auto total = value.substr(slash + 1);
    if (total != "*") {
        range.total = parse_u64(total);
        if (!range.total) {
            return std::nullopt;
        }
    }
    return range;
}

//=============================================================================
// HttpSession
//=============================================================================

struct HttpSession::Share {
    CURLSH* handle{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    Share() {
        handle = curl_share_init();
        if (!handle) return;
        curl_share_setopt(handle, CURLSHOPT_LOCKFUNC, lock);
        curl_share_setopt(handle, CURLSHOPT_UNLOCKFUNC, unlock);
        curl_share_setopt(handle, CURLSHOPT_USERDATA, this);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }

    ~Share() {
        if (handle) curl_share_cleanup(handle);
    }

    Share(const Share&) = delete;
    Share& operator=(const Share&) = delete;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Share*>(userptr)->locks[static_cast<std::size_t>(data)].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Share*>(userptr)->locks[static_cast<std::size_t>(data)].unlock();
    }
};

namespace {

void configure(CURL* curl, const HttpRequest& request, CURLSH* share, const HeaderList& headers) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
    if (!request.referer.empty()) {
        curl_easy_setopt(curl, CURLOPT_REFERER, request.referer.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));

    // Timeouts bound connecting and stalling, never the whole transfer
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.timeout.count()));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    if (share) {
        curl_easy_setopt(curl, CURLOPT_SHARE, share);
    }
}

void default_headers(HeaderList& headers) {
    headers.append("Accept: */*");
    headers.append("Accept-Language: en-US,en;q=0.9");
}

} // namespace

HttpSession::HttpSession()
    : share_(std::make_unique<Share>()) {}

HttpSession::~HttpSession() = default;

HttpSession::HttpSession(HttpSession&&) noexcept = default;
HttpSession& HttpSession::operator=(HttpSession&&) noexcept = default;

std::expected<HttpResponse, std::error_code>
HttpSession::head(const HttpRequest& request) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HeaderList headers;
    default_headers(headers);

    Transfer transfer;
    transfer.curl = curl.ptr;

    configure(curl.ptr, request, share_ ? share_->handle : nullptr, headers);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &transfer);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    deliver_headers(transfer);
    return std::move(transfer.response);
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const HttpRequest& request,
                 const ResponseHandler& on_response,
                 const BodySink& sink,
                 std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HeaderList headers;
    default_headers(headers);

    Transfer transfer;
    transfer.curl = curl.ptr;
    transfer.on_response = &on_response;
    transfer.sink = &sink;
    transfer.stop = stop;

    configure(curl.ptr, request, share_ ? share_->handle : nullptr, headers);

    std::string range;
    if (request.range) {
        range = request.range->to_string();
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (transfer.handler_error) {
        return std::unexpected(transfer.handler_error);
    }
    if (transfer.sink_stopped) {
        return std::move(transfer.response);
    }
    if (result != CURLE_OK) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }
        spdlog::debug("GET {} [{}] failed: {}", request.url, range, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    // Bodiless responses never reach the write callback
    if (!deliver_headers(transfer)) {
        return std::unexpected(transfer.handler_error);
    }
    return std::move(transfer.response);
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) noexcept {
    // Parse "attachment; filename=file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }

    auto filename = content_disposition.substr(filename_pos + 9);
    if (auto semi = filename.find(';'); semi != std::string_view::npos) {
        filename = filename.substr(0, semi);
    }
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')
        && filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace surge::core
