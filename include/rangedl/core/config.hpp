// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>

namespace rangedl::core {

constexpr std::uint64_t MEGABYTE = 1024 * 1024;

constexpr std::size_t CHUNK_SIZE = MEGABYTE;                       // Stream chunk handed to workers
constexpr std::size_t COMBINE_BLOCK_SIZE = 4096 * 1024;            // 4 MB copy blocks when merging

constexpr std::uint64_t SMALL_FILE_THRESHOLD = 50 * MEGABYTE;      // Below this, cap segment count
constexpr std::uint32_t SMALL_FILE_MAX_SEGMENTS = 5;
constexpr std::uint32_t DEFAULT_SEGMENTS = 10;

constexpr std::chrono::milliseconds ERROR_GRACE_PERIOD{1000};      // Let siblings see the signal
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr const char* SIDECAR_EXTENSION = ".json";

} // namespace rangedl::core
