// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace rangedl::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    http_error,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    invalid_segment_count,
    stale_plan,
    cancelled,
    incomplete,
    internal_error,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangedl::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::network_error:         return "Network error";
            case DownloadErrc::http_error:            return "HTTP error";
            case DownloadErrc::not_found:             return "Resource not found (404)";
            case DownloadErrc::server_error:          return "Server error (5xx)";
            case DownloadErrc::permission_denied:     return "Permission denied";
            case DownloadErrc::invalid_url:           return "Invalid URL";
            case DownloadErrc::invalid_range:         return "Invalid byte range";
            case DownloadErrc::invalid_segment_count: return "Invalid segment count";
            case DownloadErrc::stale_plan:            return "Stale resume plan";
            case DownloadErrc::cancelled:             return "Download cancelled";
            case DownloadErrc::incomplete:            return "Download incomplete";
            case DownloadErrc::internal_error:        return "Internal error";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace rangedl::core

namespace std {

template<>
struct is_error_code_enum<rangedl::core::DownloadErrc> : true_type {};

} // namespace std
