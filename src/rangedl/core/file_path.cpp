// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/file_path.hpp>
#include <filesystem>

namespace rangedl::core {

namespace fs = std::filesystem;

std::string parse_content_disposition(std::string_view value) {
    constexpr std::string_view key = "filename=";
    auto pos = value.find(key);
    if (pos == std::string_view::npos) {
        return {};
    }

    auto name = value.substr(pos + key.size());
    auto semicolon = name.find(';');
    if (semicolon != std::string_view::npos) {
        name = name.substr(0, semicolon);
    }
    while (!name.empty() && name.back() == ' ') {
        name.remove_suffix(1);
    }
    if (name.size() >= 2 && (name.front() == '"' || name.front() == '\'') && name.back() == name.front()) {
        name = name.substr(1, name.size() - 2);
    }
    return percent_decode(name);
}

std::string resolve_file_path(const Url& url,
                              const Headers& response_headers,
                              std::string_view requested_path) {
    std::string filename;
    auto it = response_headers.find("content-disposition");
    if (it != response_headers.end()) {
        filename = parse_content_disposition(it->second);
    }
    if (filename.empty()) {
        filename = url.filename();
    }
    // Never let the server pick a directory for us
    filename = fs::path(filename).filename().string();
    if (filename.empty()) {
        filename = "index.html";
    }

    if (requested_path.empty()) {
        return filename;
    }

    fs::path requested{std::string(requested_path)};
    std::error_code ec;
    if (fs::is_directory(requested, ec)) {
        return (requested / filename).string();
    }
    return requested.string();
}

} // namespace rangedl::core
