// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/http_session.hpp>
#include <surge/core/progress.hpp>
#include <surge/disk/file_writer.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>

namespace surge::core {

// Whole-body download over one connection, for servers without range support
// and for resources too small to split. Requires HTTP 200.
class SingleStreamFetcher {
public:
    SingleStreamFetcher(HttpTransport& transport, HttpRequest base);

    // Copies the body into `file` from offset 0 through a STREAM_BUFFER_SIZE
    // buffer. Runs on the calling thread, which also drives `throttle`.
    // Returns the number of bytes written.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch(disk::FileWriter& file, ProgressThrottle& throttle, std::stop_token stop) const noexcept;

private:
    HttpTransport& transport_;
    HttpRequest base_;
};

} // namespace surge::core
