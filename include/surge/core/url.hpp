// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace surge::core {

// Absolute URL split into its components. Scheme and host are stored
// lowercase; userinfo is discarded.
class Url {
public:
    // invalid_url for a missing or malformed scheme, an empty host or a bad port
    [[nodiscard]] static std::expected<Url, std::error_code> parse(std::string_view text) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::string filename() const;

    // Percent-decode a path component ("Game%20(USA).zip" -> "Game (USA).zip");
    // malformed escapes are kept verbatim
    [[nodiscard]] static std::string decode(std::string_view component);

    // Directory containing the resource, with a trailing slash:
    // https://host/files/set/game.zip -> https://host/files/set/
    [[nodiscard]] std::string parent_directory() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace surge::core
