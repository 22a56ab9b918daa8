// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <rangedl/core/transport.hpp>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace rangedl::test {

// In-memory Transport serving one resource in fixed-size chunks
class FakeTransport final : public core::Transport {
public:
    // Called before each chunk with the request's Range value ("" for none)
    // and the chunk's position within that stream
    using ChunkHook = std::function<void(const std::string& range, std::size_t chunk_index)>;

    explicit FakeTransport(std::string body, std::size_t chunk_size = 5)
        : body_(std::move(body))
        , chunk_size_(chunk_size) {
        info.status_code = 200;
        info.content_length = body_.size();
        info.accepts_ranges = true;
        info.etag = "\"v1\"";
    }

    core::ResourceInfo info;
    ChunkHook hook;

    // Streams whose Range starts at fail_at_offset fail before chunk fail_at_chunk
    std::int64_t fail_at_offset{-1};
    std::size_t fail_at_chunk{0};

    // Returned by probe() when set
    std::error_code probe_error;

    [[nodiscard]] std::expected<core::ResourceInfo, std::error_code>
    probe(const std::string&, const core::RequestOptions&) noexcept override {
        ++probes;
        if (probe_error) {
            return std::unexpected(probe_error);
        }
        return info;
    }

    [[nodiscard]] std::error_code
    stream_get(const std::string&, const core::RequestOptions& options,
               const core::ChunkHandler& on_chunk) noexcept override {
        std::string range;
        auto it = options.headers.find("Range");
        if (it != options.headers.end()) {
            range = it->second;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ranges_.push_back(range);
            requests_.push_back(options.headers);
        }

        std::uint64_t first = 0;
        std::uint64_t last = body_.empty() ? 0 : body_.size() - 1;
        if (!range.empty()) {
            // "bytes=<first>-<last>"; last past the end is clamped like a real server
            auto dash = range.find('-');
            first = std::stoull(range.substr(6, dash - 6));
            last = std::min<std::uint64_t>(std::stoull(range.substr(dash + 1)), body_.size() - 1);
            if (first >= body_.size() || first > last) {
                return make_error_code(core::DownloadErrc::invalid_range);
            }
        }

        std::size_t chunk_index = 0;
        for (std::uint64_t pos = first; pos <= last && !body_.empty(); pos += chunk_size_, ++chunk_index) {
            if (hook) {
                hook(range, chunk_index);
            }
            if (fail_at_offset >= 0 && static_cast<std::uint64_t>(fail_at_offset) == first
                && chunk_index == fail_at_chunk) {
                return make_error_code(core::DownloadErrc::network_error);
            }

            std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, last - pos + 1));
            auto* data = reinterpret_cast<const std::byte*>(body_.data() + pos);
            if (!on_chunk(std::span<const std::byte>(data, n))) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
        }
        return {};
    }

    [[nodiscard]] std::vector<std::string> ranges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ranges_;
    }

    // Full header set of every stream_get, in call order
    [[nodiscard]] std::vector<core::Headers> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void clear_ranges() {
        std::lock_guard<std::mutex> lock(mutex_);
        ranges_.clear();
        requests_.clear();
    }

    [[nodiscard]] const std::string& body() const noexcept { return body_; }

    std::atomic<int> probes{0};

private:
    std::string body_;
    std::size_t chunk_size_;
    mutable std::mutex mutex_;
    std::vector<std::string> ranges_;
    std::vector<core::Headers> requests_;
};

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("rangedl_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>('A' + (i * 7 + i / 26) % 26);
    }
    return body;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

} // namespace rangedl::test
