// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/cancellation.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/core/segment_table.hpp>
#include <rangedl/core/transport.hpp>
#include <rangedl/disk/file_writer.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <system_error>

namespace rangedl::core {

// Live state of one worker. Written only by the owning worker, polled by the
// coordinator.
struct WorkerState {
    explicit WorkerState(std::uint32_t worker_id = 0) noexcept : id(worker_id) {}

    WorkerState(const WorkerState&) = delete;
    WorkerState& operator=(const WorkerState&) = delete;

    std::uint32_t id{0};
    std::atomic<std::uint64_t> downloaded{0};
    std::atomic<double> speed_bps{0.0};     // Instantaneous, from the last chunk
    std::atomic<bool> completed{false};
    std::atomic<bool> finished{false};      // run() has returned

    // Valid once finished is set
    std::error_code error;

    [[nodiscard]] bool is_completed() const noexcept { return completed.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_finished() const noexcept { return finished.load(std::memory_order_acquire); }
};

// How the chunk loop ended
enum class TransferOutcome : std::uint8_t {
    exhausted,  // Stream ended normally
    cancelled,  // Stopped after seeing the cancellation signal
    failed,     // Transport or disk error; the signal has been set
};

// One streaming transfer into a file
struct TransferSpec {
    std::string url;
    std::string path;
    disk::OpenMode mode{disk::OpenMode::truncate};
    RequestOptions options;
};

// Shared chunk loop: append every chunk to spec.path, account it in state,
// check the signal after each chunk. On error sets the signal, waits
// ERROR_GRACE_PERIOD and logs.
[[nodiscard]] TransferOutcome chunked_transfer(const TransferSpec& spec,
                                               WorkerState& state,
                                               CancellationSignal& signal,
                                               Transport& transport) noexcept;

// Downloads one planned range into its segment file, resuming from whatever
// the file already holds.
class SegmentWorker {
public:
    SegmentWorker(const SegmentTable& table,
                  std::uint32_t index,
                  CancellationSignal& signal,
                  Transport& transport,
                  const RequestOptions& base_options);

    SegmentWorker(const SegmentWorker&) = delete;
    SegmentWorker& operator=(const SegmentWorker&) = delete;

    void run() noexcept;

    [[nodiscard]] const WorkerState& state() const noexcept { return state_; }
    [[nodiscard]] const SegmentEntry& segment() const noexcept { return segment_; }

private:
    std::string url_;
    SegmentEntry segment_;
    CancellationSignal& signal_;
    Transport& transport_;
    const RequestOptions& base_options_;
    WorkerState state_;
};

// Downloads the whole resource in one stream, no resume
class WholeFileWorker {
public:
    WholeFileWorker(std::string url,
                    std::string file_path,
                    CancellationSignal& signal,
                    Transport& transport,
                    const RequestOptions& base_options);

    WholeFileWorker(const WholeFileWorker&) = delete;
    WholeFileWorker& operator=(const WholeFileWorker&) = delete;

    void run() noexcept;

    [[nodiscard]] const WorkerState& state() const noexcept { return state_; }

private:
    std::string url_;
    std::string file_path_;
    CancellationSignal& signal_;
    Transport& transport_;
    const RequestOptions& base_options_;
    WorkerState state_;
};

} // namespace rangedl::core
