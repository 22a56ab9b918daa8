// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>

namespace rangedl::core {

// Shared stop flag for one download attempt. Monotonic: once set it stays set.
// Passed by reference to every worker and to the coordinator.
class CancellationSignal {
public:
    CancellationSignal() = default;

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    void set() noexcept { flag_.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_set() const noexcept { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};

} // namespace rangedl::core
