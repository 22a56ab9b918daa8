// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace rangedl::core {

// Concatenates "<file_path>.0" .. "<file_path>.<n-1>" into file_path, deleting
// each segment file once merged and the sidecar at the end. Does not verify
// sizes: every segment must already be complete.
class Combiner {
public:
    [[nodiscard]] static std::error_code combine(std::string_view file_path,
                                                 std::uint32_t segment_count) noexcept;
};

} // namespace rangedl::core
