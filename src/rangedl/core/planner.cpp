// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/planner.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/progress_record.hpp>
#include <rangedl/disk/error.hpp>
#include <spdlog/spdlog.h>

namespace rangedl::core {

std::uint32_t ByteRangePlanner::clamp_segments(std::uint32_t requested,
                                               std::uint64_t total_size) noexcept {
    if (requested > SMALL_FILE_MAX_SEGMENTS && total_size < SMALL_FILE_THRESHOLD) {
        return SMALL_FILE_MAX_SEGMENTS;
    }
    return requested;
}

std::expected<SegmentTable, std::error_code>
ByteRangePlanner::plan(std::string_view url,
                       std::string_view file_path,
                       std::uint32_t requested_segments,
                       std::uint64_t total_size,
                       std::string_view etag) noexcept {
    if (requested_segments == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_count));
    }
    if (total_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    try {
        std::uint32_t segments = clamp_segments(requested_segments, total_size);
        const std::string sidecar = ProgressRecord::sidecar_path(file_path);

        // Reuse the previous plan only when the remote resource is provably unchanged
        auto previous = ProgressRecord::load(sidecar);
        if (previous) {
            if (!etag.empty() && previous->url == url && previous->etag == etag) {
                spdlog::debug("resuming {} with {} segments from {}", url, previous->segment_count, sidecar);
                segments = previous->segment_count;
            } else {
                spdlog::warn("discarding stale plan in {}", sidecar);
            }
        } else if (previous.error() != make_error_code(disk::DiskErrc::file_not_found)) {
            spdlog::warn("ignoring unreadable plan {}: {}", sidecar, previous.error().message());
        }

        // Every segment needs at least one byte
        if (segments > total_size) {
            segments = static_cast<std::uint32_t>(total_size);
        }

        auto table = partition(url, file_path, segments, total_size);
        if (!table) {
            return std::unexpected(table.error());
        }

        ProgressRecord record;
        record.url = std::string(url);
        record.etag = std::string(etag);
        record.segment_count = table->segment_count;
        record.segments = table->segments;

        if (auto ec = record.save(sidecar)) {
            return std::unexpected(ec);
        }

        spdlog::debug("planned {} segments for {} bytes of {}", table->segment_count, total_size, url);
        return table;
    } catch (const std::exception& e) {
        spdlog::error("planning {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }
}

} // namespace rangedl::core
