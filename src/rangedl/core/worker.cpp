// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/worker.hpp>
#include <rangedl/core/config.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <thread>

namespace rangedl::core {

namespace fs = std::filesystem;

namespace {

// Stop every sibling, give them time to notice, then report
void abort_worker(WorkerState& state, CancellationSignal& signal, std::error_code ec) noexcept {
    signal.set();
    std::this_thread::sleep_for(ERROR_GRACE_PERIOD);
    state.error = ec;
    spdlog::error("worker {}: [{}: {}]", state.id, ec.category().name(), ec.message());
}

} // namespace

//=============================================================================
// Chunk loop
//=============================================================================

TransferOutcome chunked_transfer(const TransferSpec& spec,
                                 WorkerState& state,
                                 CancellationSignal& signal,
                                 Transport& transport) noexcept {
    using clock = std::chrono::steady_clock;

    disk::FileWriter file;
    if (auto ec = file.open(spec.path, spec.mode)) {
        abort_worker(state, signal, ec);
        return TransferOutcome::failed;
    }

    std::error_code write_error;
    bool interrupted = false;
    auto chunk_start = clock::now();

    auto ec = transport.stream_get(spec.url, spec.options,
        [&](std::span<const std::byte> chunk) {
            if (auto wec = file.write(chunk.data(), chunk.size())) {
                write_error = wec;
                return false;
            }
            state.downloaded.fetch_add(chunk.size(), std::memory_order_relaxed);

            std::chrono::duration<double> elapsed = clock::now() - chunk_start;
            if (elapsed.count() > 0.0) {
                state.speed_bps.store(static_cast<double>(chunk.size()) / elapsed.count(),
                                      std::memory_order_relaxed);
            }

            if (signal.is_set()) {
                interrupted = true;
                return false;
            }

            chunk_start = clock::now();
            return true;
        });

    auto close_ec = file.close();

    if (write_error) {
        ec = write_error;
    } else if (interrupted && ec == DownloadErrc::cancelled) {
        state.speed_bps.store(0.0, std::memory_order_relaxed);
        return TransferOutcome::cancelled;
    } else if (!ec && close_ec) {
        ec = close_ec;
    }

    if (ec) {
        state.speed_bps.store(0.0, std::memory_order_relaxed);
        abort_worker(state, signal, ec);
        return TransferOutcome::failed;
    }

    state.speed_bps.store(0.0, std::memory_order_relaxed);
    return TransferOutcome::exhausted;
}

//=============================================================================
// SegmentWorker
//=============================================================================

SegmentWorker::SegmentWorker(const SegmentTable& table,
                             std::uint32_t index,
                             CancellationSignal& signal,
                             Transport& transport,
                             const RequestOptions& base_options)
    : url_(table.url)
    , segment_(table.segments.at(index))
    , signal_(signal)
    , transport_(transport)
    , base_options_(base_options)
    , state_(index) {}

void SegmentWorker::run() noexcept {
    try {
        std::error_code ec;
        bool present = fs::exists(segment_.path, ec);
        if (ec) {
            abort_worker(state_, signal_, ec);
            state_.finished.store(true, std::memory_order_release);
            return;
        }
        if (present) {
            auto existing = fs::file_size(segment_.path, ec);
            if (ec) {
                abort_worker(state_, signal_, ec);
                state_.finished.store(true, std::memory_order_release);
                return;
            }

            if (existing > segment_.size) {
                // Left over from a different plan
                spdlog::warn("segment {}: {} bytes on disk exceed planned {}, restarting",
                             segment_.index, existing, segment_.size);
                fs::remove(segment_.path, ec);
                if (ec) {
                    abort_worker(state_, signal_, ec);
                    state_.finished.store(true, std::memory_order_release);
                    return;
                }
            } else {
                state_.downloaded.store(existing, std::memory_order_relaxed);
            }
        }

        auto downloaded = state_.downloaded.load(std::memory_order_relaxed);
        if (downloaded < segment_.size) {
            TransferSpec spec{
                url_,
                segment_.path,
                disk::OpenMode::append,
                base_options_.with_range(segment_.start + downloaded, segment_.end),
            };
            spdlog::debug("segment {}: requesting bytes {}-{}", segment_.index,
                          segment_.start + downloaded, segment_.end);

            if (chunked_transfer(spec, state_, signal_, transport_) != TransferOutcome::exhausted) {
                state_.finished.store(true, std::memory_order_release);
                return;
            }
        }

        if (state_.downloaded.load(std::memory_order_relaxed) == segment_.size) {
            state_.completed.store(true, std::memory_order_release);
        } else {
            spdlog::warn("segment {}: stream ended at {} of {} bytes", segment_.index,
                         state_.downloaded.load(std::memory_order_relaxed), segment_.size);
            state_.error = make_error_code(DownloadErrc::incomplete);
        }
    } catch (const std::exception& e) {
        spdlog::debug("worker {}: {}", state_.id, e.what());
        abort_worker(state_, signal_, make_error_code(DownloadErrc::network_error));
    }
    state_.finished.store(true, std::memory_order_release);
}

//=============================================================================
// WholeFileWorker
//=============================================================================

WholeFileWorker::WholeFileWorker(std::string url,
                                 std::string file_path,
                                 CancellationSignal& signal,
                                 Transport& transport,
                                 const RequestOptions& base_options)
    : url_(std::move(url))
    , file_path_(std::move(file_path))
    , signal_(signal)
    , transport_(transport)
    , base_options_(base_options) {}

void WholeFileWorker::run() noexcept {
    try {
        TransferSpec spec{url_, file_path_, disk::OpenMode::truncate, base_options_};
        if (chunked_transfer(spec, state_, signal_, transport_) == TransferOutcome::exhausted) {
            state_.completed.store(true, std::memory_order_release);
        }
    } catch (const std::exception& e) {
        spdlog::debug("worker {}: {}", state_.id, e.what());
        abort_worker(state_, signal_, make_error_code(DownloadErrc::network_error));
    }
    state_.finished.store(true, std::memory_order_release);
}

} // namespace rangedl::core
