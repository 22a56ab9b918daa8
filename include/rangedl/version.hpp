// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <string>

namespace rangedl {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 1;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }
} version;

} // namespace rangedl
