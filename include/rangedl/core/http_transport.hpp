// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/transport.hpp>
#include <string_view>

namespace rangedl::core {

// libcurl implementation of Transport. One easy handle per call, so a single
// instance may be shared by all workers of a download.
class HttpTransport final : public Transport {
public:
    HttpTransport() = default;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url, const RequestOptions& options) noexcept override;

    [[nodiscard]] std::error_code
    stream_get(const std::string& url,
               const RequestOptions& options,
               const ChunkHandler& on_chunk) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status >= 400 to a download error
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;
};

} // namespace rangedl::core
