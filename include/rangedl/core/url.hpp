// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace rangedl::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }

    // The URL exactly as given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    // Last path component, percent-decoded ("index.html" for directory URLs)
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

// Decode %XX escapes; malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace rangedl::core
