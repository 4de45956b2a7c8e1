// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace surge::cli {

// Single-line terminal progress bar, redrawn in place on stdout
class ProgressBar {
public:
    using clock = std::chrono::steady_clock;

    explicit ProgressBar(std::string_view label = {});

    // Redraw with the latest (downloaded, total); speed is averaged since start
    void update(std::uint64_t current, std::uint64_t total) noexcept;

    void finish() noexcept;
    void clear() noexcept;

    [[nodiscard]] std::string render(std::uint64_t current,
                                     std::uint64_t total,
                                     std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::string label_;
    clock::time_point started_;
    std::uint64_t last_current_{0};
    std::uint64_t last_total_{0};
    std::size_t last_width_{0};
    bool drawn_{false};
    bool finished_{false};
};

} // namespace surge::cli
