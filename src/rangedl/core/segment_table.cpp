// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/segment_table.hpp>
#include <new>

namespace rangedl::core {

std::uint64_t SegmentTable::total_size() const noexcept {
    std::uint64_t total = 0;
    for (const auto& seg : segments) {
        total += seg.size;
    }
    return total;
}

std::string segment_path(std::string_view file_path, std::uint32_t index) {
    std::string path(file_path);
    path += '.';
    path += std::to_string(index);
    return path;
}

std::expected<SegmentTable, std::error_code>
partition(std::string_view url, std::string_view file_path,
          std::uint32_t segment_count, std::uint64_t total_size) noexcept {
    if (segment_count == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_count));
    }
    if (total_size < segment_count) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    try {
        SegmentTable table;
        table.url = std::string(url);
        table.segment_count = segment_count;
        table.segments.reserve(segment_count);

        const double partition_size = static_cast<double>(total_size) / segment_count;
        const std::uint32_t last = segment_count - 1;

        for (std::uint32_t i = 0; i < segment_count; ++i) {
            SegmentEntry seg;
            seg.index = i;
            seg.start = static_cast<std::uint64_t>(partition_size * i);
            // The last boundary is pinned so rounding can never drop bytes
            std::uint64_t boundary = (i == last)
                ? total_size
                : static_cast<std::uint64_t>(partition_size * (i + 1));

            seg.size = boundary - seg.start;
            // [0-100, 100-200] -> [0-99, 100-200]; the last range keeps its end
            seg.end = (i == last) ? boundary : boundary - 1;
            seg.path = segment_path(file_path, i);
            table.segments.push_back(std::move(seg));
        }

        return table;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }
}

} // namespace rangedl::core
