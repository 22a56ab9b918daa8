// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::core {

// One planned byte range and the temporary file that receives it
struct SegmentEntry {
    std::uint32_t index{0};
    std::uint64_t start{0};   // First byte, inclusive
    std::uint64_t end{0};     // Last byte requested (the final segment asks for one past the end)
    std::uint64_t size{0};    // Bytes this segment's file holds once complete
    std::string path;
};

// Plan for one download attempt, ordered by index
struct SegmentTable {
    std::string url;
    std::uint32_t segment_count{0};
    std::vector<SegmentEntry> segments;

    [[nodiscard]] std::uint64_t total_size() const noexcept;
};

// "<file_path>.<index>"
[[nodiscard]] std::string segment_path(std::string_view file_path, std::uint32_t index);

// Split [0, total_size) into segment_count contiguous ranges.
// Requires 1 <= segment_count <= total_size.
[[nodiscard]] std::expected<SegmentTable, std::error_code>
partition(std::string_view url, std::string_view file_path,
          std::uint32_t segment_count, std::uint64_t total_size) noexcept;

} // namespace rangedl::core
