// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/progress_bar.hpp>
#include <format>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace rangedl::cli {

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (finished_) return;

    // Unknown size: show bytes only
    if (total_ > 0) {
        auto scaled = current * 100 / total_;
        auto last_scaled = last_drawn_ * 100 / total_;
        if (scaled == last_scaled && current != total_ && last_drawn_ != 0) return;
    }
    last_drawn_ = current;

    std::cout << '\r' << render(current, speed_bps) << std::flush;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ == 0) {
        line += format_bytes(current);
    } else {
        double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);

        constexpr int bar_width = 30;
        const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

        line += '[';
        line.append(static_cast<std::size_t>(filled), '=');
        line += '>';
        line.append(static_cast<std::size_t>(bar_width - filled), ' ');
        line += ']';

        line += std::format(" {:>3}% ({}/{})", static_cast<int>(percent),
                            format_bytes(current), format_bytes(total_));
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (total_ > current) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    return line;
}

void ProgressBar::finish() {
    if (finished_) return;
    std::cout << '\r' << render(total_ > 0 ? total_ : last_drawn_, 0) << std::endl;
    finished_ = true;
}

void ProgressBar::clear() {
    std::cout << '\r' << std::string(100, ' ') << '\r' << std::flush;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const auto value = static_cast<double>(bytes);
    if (value >= GB) {
        return std::format("{:.2f} GB", value / GB);
    } else if (value >= MB) {
        return std::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return std::format("{:.0f} KB", value / KB);
    }
    return std::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;
    return std::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

} // namespace rangedl::cli
