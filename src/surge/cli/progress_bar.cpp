// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/progress_bar.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace surge::cli {

namespace {

constexpr int BAR_WIDTH = 30;
constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label)
    , started_(clock::now()) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total) noexcept {
    if (finished_) return;

    last_current_ = current;
    last_total_ = total;

    auto elapsed = std::chrono::duration<double>(clock::now() - started_).count();
    std::uint64_t speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(current) / elapsed) : 0;

    try {
        auto line = render(current, total, speed);
        // Pad over any longer line drawn before
        std::size_t width = line.size();
        if (width < last_width_) {
            line.append(last_width_ - width, ' ');
        }
        last_width_ = width;
        fmt::print("\r{}", line);
        std::fflush(stdout);
        drawn_ = true;
    } catch (const std::exception&) {
        // Drawing is best effort
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (last_total_ > 0) {
        update(last_total_, last_total_);
    }
    finished_ = true;
    if (drawn_) {
        std::fputc('\n', stdout);
        std::fflush(stdout);
    }
}

void ProgressBar::clear() noexcept {
    if (!drawn_) return;
    std::fputc('\r', stdout);
    for (std::size_t i = 0; i < last_width_; ++i) {
        std::fputc(' ', stdout);
    }
    std::fputc('\r', stdout);
    std::fflush(stdout);
    drawn_ = false;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t total, std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total == 0) {
        // Unknown size: bytes and speed only
        line += format_bytes(current);
    } else {
        double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
        const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

        line += '[';
        line.append(static_cast<std::size_t>(filled), '=');
        if (filled < BAR_WIDTH) {
            line += '>';
            line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
        }
        line += ']';
        line += fmt::format(" {:3}% ({}/{})", static_cast<int>(percent), format_bytes(current), format_bytes(total));
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
        if (total > current) {
            line += " ETA ";
            line += format_time((total - current) / speed_bps);
        }
    }
    return line;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    if (bps >= GB) return fmt::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return fmt::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return fmt::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return fmt::format("{} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    if (bytes >= GB) return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

} // namespace surge::cli
