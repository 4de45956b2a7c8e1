// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/single_stream.hpp>
#include <surge/core/config.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <utility>

namespace surge::core {

SingleStreamFetcher::SingleStreamFetcher(HttpTransport& transport, HttpRequest base)
    : transport_(transport)
    , base_(std::move(base)) {
    base_.range.reset();
}

std::expected<std::uint64_t, std::error_code>
SingleStreamFetcher::fetch(disk::FileWriter& file, ProgressThrottle& throttle, std::stop_token stop) const noexcept {
    disk::BufferedWriter writer(file, STREAM_BUFFER_SIZE);
    std::optional<std::uint64_t> announced;
    std::error_code write_error;

    ResponseHandler on_response = [&](const HttpResponse& response) -> std::error_code {
        if (response.status_code != 200) {
            return make_http_error(response.status_code);
        }
        announced = response.content_length;
        if (announced) {
            throttle.total(*announced);
        }
        return {};
    };

    BodySink sink = [&](const std::byte* data, std::size_t size) -> SinkAction {
        write_error = writer.append(data, size);
        if (write_error) {
            return SinkAction::stop;
        }
        throttle.update(writer.size());
        return SinkAction::proceed;
    };

    auto response = transport_.get(base_, on_response, sink, stop);

    if (write_error) {
        return std::unexpected(write_error);
    }
    if (!response) {
        return std::unexpected(response.error());
    }
    if (auto ec = writer.flush()) {
        return std::unexpected(ec);
    }
    if (announced && writer.size() < *announced) {
        spdlog::debug("Stream ended after {} of {} bytes", writer.size(), *announced);
        return std::unexpected(make_error_code(DownloadErrc::short_body));
    }
    return writer.size();
}

} // namespace surge::core
