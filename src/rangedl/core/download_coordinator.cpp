// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/download_coordinator.hpp>
#include <rangedl/core/combiner.hpp>
#include <rangedl/core/file_path.hpp>
#include <rangedl/core/planner.hpp>
#include <rangedl/core/url.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <thread>

namespace rangedl::core {

std::string_view to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:      return "idle";
        case DownloadState::probing:   return "probing";
        case DownloadState::planning:  return "planning";
        case DownloadState::running:   return "running";
        case DownloadState::combining: return "combining";
        case DownloadState::done:      return "done";
        case DownloadState::aborted:   return "aborted";
        case DownloadState::failed:    return "failed";
    }
    return "unknown";
}

//=============================================================================
// DownloadCoordinator
//=============================================================================

DownloadCoordinator::DownloadCoordinator(Transport& transport, DownloadOptions options)
    : transport_(transport)
    , options_(std::move(options)) {}

std::expected<DownloadState, std::error_code>
DownloadCoordinator::run(std::string_view url, std::string_view requested_path) noexcept {
    auto expected = DownloadState::idle;
    if (!state_.compare_exchange_strong(expected, DownloadState::probing, std::memory_order_acq_rel)) {
        return std::unexpected(std::make_error_code(std::errc::operation_in_progress));
    }

    auto parsed = Url::parse(url);
    if (!parsed) {
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(parsed.error());
    }

    auto info = transport_.probe(parsed->str(), options_.request);
    if (!info) {
        spdlog::error("probing {} failed: {}", url, info.error().message());
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(info.error());
    }

    std::string file_path;
    try {
        file_path = resolve_file_path(*parsed, info->headers, requested_path);
    } catch (const std::exception& e) {
        spdlog::error("resolving destination for {} failed: {}", url, e.what());
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    // Hand over to the second stage, which expects idle
    state_.store(DownloadState::idle, std::memory_order_release);
    return run(url, std::move(file_path), *info);
}

std::expected<DownloadState, std::error_code>
DownloadCoordinator::run(std::string_view url, std::string file_path, const ResourceInfo& info) noexcept {
    auto expected = DownloadState::idle;
    if (!state_.compare_exchange_strong(expected, DownloadState::planning, std::memory_order_acq_rel)) {
        return std::unexpected(std::make_error_code(std::errc::operation_in_progress));
    }

    if (options_.segments == 0) {
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_count));
    }

    try {
        file_path_ = std::move(file_path);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_ = {};
            progress_.total_bytes = info.content_length;
        }

        std::string url_str(url);
        return use_segments(options_, info)
            ? run_segmented(url_str, info)
            : run_whole_file(url_str, info);
    } catch (const std::exception& e) {
        spdlog::error("download of {} failed: {}", url, e.what());
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(make_error_code(DownloadErrc::internal_error));
    }
}

bool DownloadCoordinator::use_segments(const DownloadOptions& options,
                                       const ResourceInfo& info) noexcept {
    return options.multi_segment
        && options.segments > 1
        && info.accepts_ranges
        && info.content_length > 0;
}

std::expected<DownloadState, std::error_code>
DownloadCoordinator::run_segmented(const std::string& url, const ResourceInfo& info) noexcept {
    auto table = ByteRangePlanner::plan(url, file_path_, options_.segments,
                                        info.content_length, info.etag);
    if (!table) {
        spdlog::error("planning {} failed: {}", file_path_, table.error().message());
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(table.error());
    }
    segment_count_ = table->segment_count;

    try {
        std::vector<std::unique_ptr<SegmentWorker>> workers;
        std::vector<std::function<void()>> tasks;
        std::vector<const WorkerState*> states;
        workers.reserve(segment_count_);

        for (std::uint32_t i = 0; i < segment_count_; ++i) {
            auto worker = std::make_unique<SegmentWorker>(*table, i, signal_, transport_, options_.request);
            tasks.emplace_back([w = worker.get()] { w->run(); });
            states.push_back(&worker->state());
            workers.push_back(std::move(worker));
        }

        state_.store(DownloadState::running, std::memory_order_release);
        drive(tasks, states);

        bool all_completed = true;
        for (const auto* st : states) {
            all_completed = all_completed && st->is_completed();
        }

        if (!all_completed) {
            // Segment files and the sidecar stay behind for the next attempt
            spdlog::warn("download of {} incomplete; rerun to resume", file_path_);
            state_.store(DownloadState::aborted, std::memory_order_release);
            return DownloadState::aborted;
        }
    } catch (const std::system_error& e) {
        // Thread creation failed; whatever did start has been joined
        signal_.set();
        spdlog::error("could not start workers for {}: {}", file_path_, e.what());
        state_.store(DownloadState::aborted, std::memory_order_release);
        return DownloadState::aborted;
    } catch (const std::exception& e) {
        signal_.set();
        spdlog::error("download of {} failed: {}", file_path_, e.what());
        state_.store(DownloadState::aborted, std::memory_order_release);
        return DownloadState::aborted;
    }

    state_.store(DownloadState::combining, std::memory_order_release);
    if (auto ec = Combiner::combine(file_path_, segment_count_)) {
        state_.store(DownloadState::failed, std::memory_order_release);
        return std::unexpected(ec);
    }

    state_.store(DownloadState::done, std::memory_order_release);
    return DownloadState::done;
}

std::expected<DownloadState, std::error_code>
DownloadCoordinator::run_whole_file(const std::string& url, const ResourceInfo& /*info*/) noexcept {
    segment_count_ = 1;

    try {
        WholeFileWorker worker(url, file_path_, signal_, transport_, options_.request);
        std::vector<std::function<void()>> tasks{[&worker] { worker.run(); }};
        std::vector<const WorkerState*> states{&worker.state()};

        state_.store(DownloadState::running, std::memory_order_release);
        drive(tasks, states);

        if (!worker.state().is_completed()) {
            state_.store(DownloadState::aborted, std::memory_order_release);
            return DownloadState::aborted;
        }
    } catch (const std::exception& e) {
        signal_.set();
        spdlog::error("download of {} failed: {}", file_path_, e.what());
        state_.store(DownloadState::aborted, std::memory_order_release);
        return DownloadState::aborted;
    }

    state_.store(DownloadState::done, std::memory_order_release);
    return DownloadState::done;
}

void DownloadCoordinator::drive(const std::vector<std::function<void()>>& tasks,
                                const std::vector<const WorkerState*>& states) {
    std::vector<std::jthread> threads;
    threads.reserve(tasks.size());
    try {
        // No new workers once cancelled
        for (const auto& task : tasks) {
            if (signal_.is_set()) break;
            threads.emplace_back(task);
        }
    } catch (...) {
        signal_.set();
        throw;  // jthread destructors join the started workers
    }

    while (true) {
        update_progress(states);

        bool all_completed = true;
        bool all_finished = true;
        for (const auto* st : states) {
            all_completed = all_completed && st->is_completed();
            all_finished = all_finished && st->is_finished();
        }

        if (all_completed || all_finished || signal_.is_set()) {
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    // Cancelled workers stop after their current chunk
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }

    update_progress(states);
}

void DownloadCoordinator::update_progress(const std::vector<const WorkerState*>& states) {
    std::uint64_t downloaded = 0;
    double speed = 0.0;
    std::uint32_t completed = 0;

    for (const auto* st : states) {
        downloaded += st->downloaded.load(std::memory_order_relaxed);
        speed += st->speed_bps.load(std::memory_order_relaxed);
        if (st->is_completed()) ++completed;
    }

    DownloadProgress snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.downloaded_bytes = downloaded;
        progress_.speed_bps = static_cast<std::uint64_t>(speed);
        progress_.workers = static_cast<std::uint32_t>(states.size());
        progress_.completed_workers = completed;
        if (progress_.total_bytes > 0) {
            progress_.percent = static_cast<double>(downloaded) * 100.0
                                / static_cast<double>(progress_.total_bytes);
        }
        if (progress_.speed_bps > 0 && progress_.total_bytes > downloaded) {
            progress_.eta_seconds = (progress_.total_bytes - downloaded) / progress_.speed_bps;
        } else {
            progress_.eta_seconds = 0;
        }
        snap = progress_;
    }

    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> cb_lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        try {
            cb(snap);
        } catch (const std::exception& e) {
            spdlog::warn("progress callback threw: {}", e.what());
        }
    }
}

DownloadProgress DownloadCoordinator::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

} // namespace rangedl::core
