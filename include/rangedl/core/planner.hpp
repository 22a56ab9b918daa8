// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/segment_table.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace rangedl::core {

// Computes the segment table for a download and persists it in the sidecar
class ByteRangePlanner {
public:
    // Resolve the segment count (clamp, resume reuse), write the sidecar and
    // partition total_size. An unreadable or mismatching sidecar is ignored.
    [[nodiscard]] static std::expected<SegmentTable, std::error_code>
    plan(std::string_view url,
         std::string_view file_path,
         std::uint32_t requested_segments,
         std::uint64_t total_size,
         std::string_view etag) noexcept;

    // Files under SMALL_FILE_THRESHOLD get at most SMALL_FILE_MAX_SEGMENTS
    [[nodiscard]] static std::uint32_t clamp_segments(std::uint32_t requested,
                                                      std::uint64_t total_size) noexcept;
};

} // namespace rangedl::core
