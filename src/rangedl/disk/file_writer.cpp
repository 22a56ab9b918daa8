// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/disk/file_writer.hpp>
#include <cerrno>
#include <new>

namespace rangedl::disk {

std::error_code errno_to_error(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT: return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:  return make_error_code(DiskErrc::access_denied);
        case ENOSPC: return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR: return make_error_code(DiskErrc::invalid_path);
        default:     return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

std::error_code FileWriter::open(std::string_view path, OpenMode mode) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::write_error);
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    errno = 0;
    std::FILE* fp = std::fopen(path_.c_str(), mode == OpenMode::append ? "ab" : "wb");
    if (!fp) {
        return errno_to_error(errno, DiskErrc::write_error);
    }
    file_.reset(fp);
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::write_error);
    }
    if (size == 0) {
        return {};
    }

    errno = 0;
    if (std::fwrite(data, 1, size, file_.get()) != size) {
        return errno_to_error(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::write_error);
    }
    errno = 0;
    if (std::fflush(file_.get()) != 0) {
        return errno_to_error(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (!file_) {
        return {};
    }
    errno = 0;
    int rc = std::fclose(file_.release());
    if (rc != 0) {
        return errno_to_error(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace rangedl::disk
