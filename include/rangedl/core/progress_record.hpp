// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/segment_table.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rangedl::core {

// Sidecar persisted next to the destination as "<file_path>.json".
// Written by the planner, deleted by the combiner, never touched by workers.
//
//   { "url": "...", "etag": "..." | false, "segments": N,
//     "0": {"start": 0, "end": 24, "segment_size": 25, "segment_path": "f.0"}, ... }
struct ProgressRecord {
    std::string url;
    std::string etag;                    // Empty is stored as false
    std::uint32_t segment_count{0};
    std::vector<SegmentEntry> segments;

    // Get the sidecar path for a given output file
    [[nodiscard]] static std::string sidecar_path(std::string_view file_path);

    // Save to path, replacing any previous content
    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    // Load from path. Missing file -> DiskErrc::file_not_found, anything
    // unparseable or inconsistent -> DownloadErrc::stale_plan.
    [[nodiscard]] static std::expected<ProgressRecord, std::error_code>
    load(std::string_view path) noexcept;

    // Check if a sidecar exists for the given output
    [[nodiscard]] static bool exists(std::string_view file_path) noexcept;

    // Delete the sidecar for the given output; absent is not an error
    [[nodiscard]] static std::error_code remove(std::string_view file_path) noexcept;
};

} // namespace rangedl::core
