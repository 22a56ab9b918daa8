// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/transport.hpp>

namespace rangedl::core {

RequestOptions RequestOptions::with_range(std::uint64_t first, std::uint64_t last) const {
    RequestOptions derived = *this;
    derived.headers["Range"] = "bytes=" + std::to_string(first) + "-" + std::to_string(last);
    return derived;
}

} // namespace rangedl::core
