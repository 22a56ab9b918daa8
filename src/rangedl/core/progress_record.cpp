// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/progress_record.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rangedl::core {

namespace fs = std::filesystem;

std::string ProgressRecord::sidecar_path(std::string_view file_path) {
    return std::string(file_path) + SIDECAR_EXTENSION;
}

std::error_code ProgressRecord::save(std::string_view path) const noexcept {
    try {
        nlohmann::json j;
        j["url"] = url;
        if (etag.empty()) {
            j["etag"] = false;
        } else {
            j["etag"] = etag;
        }
        j["segments"] = segment_count;

        for (const auto& seg : segments) {
            j[std::to_string(seg.index)] = {
                {"start", seg.start},
                {"end", seg.end},
                {"segment_size", seg.size},
                {"segment_path", seg.path},
            };
        }

        fs::path p{std::string(path)};
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(4);
        file.flush();
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<ProgressRecord, std::error_code>
ProgressRecord::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream contents;
        contents << file.rdbuf();

        auto j = nlohmann::json::parse(contents.str(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::stale_plan));
        }

        auto url_it = j.find("url");
        auto etag_it = j.find("etag");
        auto count_it = j.find("segments");
        if (url_it == j.end() || !url_it->is_string() ||
            etag_it == j.end() || count_it == j.end() ||
            !count_it->is_number_integer()) {
            return std::unexpected(make_error_code(DownloadErrc::stale_plan));
        }

        ProgressRecord record;
        record.url = url_it->get<std::string>();

        if (etag_it->is_string()) {
            record.etag = etag_it->get<std::string>();
        } else if (!etag_it->is_boolean() || etag_it->get<bool>()) {
            return std::unexpected(make_error_code(DownloadErrc::stale_plan));
        }

        auto count = count_it->get<std::int64_t>();
        if (count <= 0 || count > static_cast<std::int64_t>(UINT32_MAX)) {
            return std::unexpected(make_error_code(DownloadErrc::stale_plan));
        }
        record.segment_count = static_cast<std::uint32_t>(count);

        // Per-segment entries are informational; keep the ones that are well formed
        for (std::uint32_t i = 0; i < record.segment_count; ++i) {
            auto seg_it = j.find(std::to_string(i));
            if (seg_it == j.end() || !seg_it->is_object()) {
                continue;
            }
            SegmentEntry seg;
            seg.index = i;
            seg.start = seg_it->value("start", std::uint64_t{0});
            seg.end = seg_it->value("end", std::uint64_t{0});
            seg.size = seg_it->value("segment_size", std::uint64_t{0});
            seg.path = seg_it->value("segment_path", std::string{});
            record.segments.push_back(std::move(seg));
        }

        return record;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::stale_plan));
    }
}

bool ProgressRecord::exists(std::string_view file_path) noexcept {
    std::error_code ec;
    return fs::exists(sidecar_path(file_path), ec);
}

std::error_code ProgressRecord::remove(std::string_view file_path) noexcept {
    try {
        std::error_code ec;
        fs::remove(sidecar_path(file_path), ec);
        return ec ? make_error_code(disk::DiskErrc::remove_error) : std::error_code{};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::remove_error);
    }
}

} // namespace rangedl::core
