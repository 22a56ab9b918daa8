// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/download_coordinator.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::cli {

// Exit codes
constexpr int EXIT_DONE = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_INCOMPLETE = 2;  // Aborted; rerun to resume

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output;
    std::uint32_t segments{core::DEFAULT_SEGMENTS};
    bool single{false};
    core::Headers headers;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when the arguments are unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Build coordinator options from the arguments
[[nodiscard]] core::DownloadOptions to_options(const CliArgs& args);

// Download a single URL
[[nodiscard]] CliResult download(const std::string& url, const CliArgs& args) noexcept;

// Show resource info without downloading
[[nodiscard]] CliResult info(const std::string& url, const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace rangedl::cli
