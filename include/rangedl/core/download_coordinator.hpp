// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/cancellation.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/core/transport.hpp>
#include <rangedl/core/worker.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::core {

// Lifecycle of one download attempt
enum class DownloadState : std::uint8_t {
    idle,       // Not started
    probing,    // HEAD request in flight
    planning,   // Building the segment table
    running,    // Workers active
    combining,  // Merging segment files
    done,       // Final file in place
    aborted,    // Stopped early; partial state left on disk for resume
    failed,     // Could not start (probe or plan error)
};

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;

// Aggregate progress across all workers
struct DownloadProgress {
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t speed_bps{0};           // Sum of worker speeds
    std::uint32_t workers{0};
    std::uint32_t completed_workers{0};
    double percent{0.0};
    std::uint64_t eta_seconds{0};
};

// Download configuration
struct DownloadOptions {
    std::uint32_t segments{DEFAULT_SEGMENTS};
    bool multi_segment{true};
    RequestOptions request;               // Base request every worker derives from
    std::chrono::milliseconds poll_interval{POLL_INTERVAL};
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

// Drives one download attempt:
//   planning -> running -> {combining -> done} | aborted
// A coordinator is single use; create a new one to resume.
class DownloadCoordinator {
public:
    explicit DownloadCoordinator(Transport& transport, DownloadOptions options = {});

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Probe the URL, resolve the destination, then download
    [[nodiscard]] std::expected<DownloadState, std::error_code>
    run(std::string_view url, std::string_view requested_path = {}) noexcept;

    // Download a resource already probed into file_path
    [[nodiscard]] std::expected<DownloadState, std::error_code>
    run(std::string_view url, std::string file_path, const ResourceInfo& info) noexcept;

    // Stop all workers after their current chunk. Safe from a signal handler.
    void cancel() noexcept { signal_.set(); }

    // Set progress callback (thread-safe)
    void callback(ProgressCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] DownloadProgress progress() const;
    [[nodiscard]] const std::string& file_path() const noexcept { return file_path_; }
    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool cancelled() const noexcept { return signal_.is_set(); }

    // Segments in the plan; 1 for whole-file mode
    [[nodiscard]] std::uint32_t segment_count() const noexcept { return segment_count_; }

private:
    [[nodiscard]] std::expected<DownloadState, std::error_code>
    run_segmented(const std::string& url, const ResourceInfo& info) noexcept;

    [[nodiscard]] std::expected<DownloadState, std::error_code>
    run_whole_file(const std::string& url, const ResourceInfo& info) noexcept;

    // Spawn one thread per task, poll states until done or cancelled, join
    void drive(const std::vector<std::function<void()>>& tasks,
               const std::vector<const WorkerState*>& states);

    void update_progress(const std::vector<const WorkerState*>& states);

    [[nodiscard]] static bool use_segments(const DownloadOptions& options,
                                           const ResourceInfo& info) noexcept;

    Transport& transport_;
    DownloadOptions options_;
    CancellationSignal signal_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::string file_path_;
    std::uint32_t segment_count_{0};

    DownloadProgress progress_;
    mutable std::mutex mutex_;

    ProgressCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access
};

} // namespace rangedl::core
