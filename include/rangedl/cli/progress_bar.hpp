// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rangedl::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Update progress
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Finish the progress bar
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    // Line without the leading carriage return; exposed for tests
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    // HH:MM:SS
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::uint64_t total_{0};
    std::uint64_t last_drawn_{0};
    std::string label_;
    bool finished_{false};
};

} // namespace rangedl::cli
