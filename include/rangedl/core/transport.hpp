// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <span>
#include <string>

namespace rangedl::core {

using Headers = std::map<std::string, std::string>;

// Base request configuration shared by every worker of a download.
// Workers never mutate it; they derive their own copy (see with_range()).
struct RequestOptions {
    Headers headers;

    [[nodiscard]] RequestOptions with_range(std::uint64_t first, std::uint64_t last) const;
};

// Result of a HEAD probe
struct ResourceInfo {
    std::int32_t status_code{0};
    std::uint64_t content_length{0};   // 0 when unknown
    bool accepts_ranges{false};
    std::string etag;                  // Empty when the server sent none
    Headers headers;                   // Lower-cased names
};

// Receives one chunk; return false to close the stream
using ChunkHandler = std::function<bool(std::span<const std::byte>)>;

// Streaming HTTP capability used by the workers
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url, const RequestOptions& options) noexcept = 0;

    // Delivers the body in chunks of at most CHUNK_SIZE bytes. Returns an empty
    // code when the body is exhausted, DownloadErrc::cancelled when the handler
    // stopped the stream, and any other code on transport failure.
    [[nodiscard]] virtual std::error_code
    stream_get(const std::string& url,
               const RequestOptions& options,
               const ChunkHandler& on_chunk) noexcept = 0;
};

} // namespace rangedl::core
