// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace rangedl::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    remove_error,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangedl::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::file_not_found: return "File not found";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::read_error:     return "Read error";
            case DiskErrc::remove_error:   return "Could not remove file";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace rangedl::disk

namespace std {

template<>
struct is_error_code_enum<rangedl::disk::DiskErrc> : true_type {};

} // namespace std
