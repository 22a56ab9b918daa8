// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/combiner.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/progress_record.hpp>
#include <rangedl/core/segment_table.hpp>
#include <rangedl/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace rangedl::core {

namespace {

struct FileCloser {
    void operator()(std::FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

std::error_code append_file(disk::FileWriter& dest, const std::string& src_path,
                            std::vector<std::byte>& block) noexcept {
    errno = 0;
    std::unique_ptr<std::FILE, FileCloser> src(std::fopen(src_path.c_str(), "rb"));
    if (!src) {
        return disk::errno_to_error(errno, disk::DiskErrc::read_error);
    }

    while (true) {
        std::size_t n = std::fread(block.data(), 1, block.size(), src.get());
        if (n > 0) {
            if (auto ec = dest.write(block.data(), n)) {
                return ec;
            }
        }
        if (n < block.size()) {
            if (std::ferror(src.get())) {
                return make_error_code(disk::DiskErrc::read_error);
            }
            break;
        }
    }
    return {};
}

} // namespace

std::error_code Combiner::combine(std::string_view file_path, std::uint32_t segment_count) noexcept {
    try {
        disk::FileWriter dest;
        if (auto ec = dest.open(file_path, disk::OpenMode::truncate)) {
            return ec;
        }

        std::vector<std::byte> block(COMBINE_BLOCK_SIZE);

        for (std::uint32_t i = 0; i < segment_count; ++i) {
            const std::string path = segment_path(file_path, i);
            if (auto ec = append_file(dest, path, block)) {
                spdlog::error("merging {} failed: {}", path, ec.message());
                return ec;
            }

            std::error_code rm_ec;
            std::filesystem::remove(path, rm_ec);
            if (rm_ec) {
                spdlog::warn("could not remove {}: {}", path, rm_ec.message());
            }
        }

        if (auto ec = dest.close()) {
            return ec;
        }

        if (auto ec = ProgressRecord::remove(file_path)) {
            spdlog::warn("could not remove {}: {}", ProgressRecord::sidecar_path(file_path), ec.message());
        }

        spdlog::debug("combined {} segments into {}", segment_count, file_path);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("combining {} failed: {}", file_path, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace rangedl::core
