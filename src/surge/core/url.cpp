// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace surge::core {

namespace {

std::unexpected<std::error_code> bad_url() noexcept {
    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
}

// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool valid_scheme(std::string_view scheme) noexcept {
    if (scheme.empty() || std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '+' || c == '-' || c == '.';
    });
}

bool valid_port(std::string_view port) noexcept {
    if (port.empty()) {
        return true;
    }
    if (port.size() > 5) {
        return false;
    }
    unsigned value = 0;
    for (char c : port) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value <= 65535;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view text) noexcept {
    auto separator = text.find("://");
    if (separator == std::string_view::npos || !valid_scheme(text.substr(0, separator))) {
        return bad_url();
    }

    Url url;
    url.scheme_ = lowercase(text.substr(0, separator));
    std::string_view rest = text.substr(separator + 3);

    // Peel off the fragment, then the query, leaving authority + path
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        url.fragment_ = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        url.query_ = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    url.path_ = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

    // Credentials are never sent; drop them
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return bad_url();
        }
        host = authority.substr(0, close + 1);
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') return bad_url();
            port = tail.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty() || !valid_port(port)) {
        return bad_url();
    }

    url.host_ = lowercase(host);
    url.port_ = port;
    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    // For directory URLs (path ends with /), default to index.html
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

std::string Url::decode(std::string_view component) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(component.size());
    for (std::size_t i = 0; i < component.size(); ++i) {
        if (component[i] == '%' && i + 2 < component.size()) {
            int hi = hex(component[i + 1]);
            int lo = hex(component[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += component[i];
    }
    return out;
}

std::string Url::parent_directory() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return base() + "/";
    }
    return base() + path_.substr(0, last_slash + 1);
}

} // namespace surge::core
