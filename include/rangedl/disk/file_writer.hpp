// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/disk/error.hpp>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

namespace rangedl::disk {

enum class OpenMode {
    truncate,  // Start a fresh file
    append,    // Continue a partial file
};

// Sequential writer owning one file. Each segment file has exactly one writer.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    [[nodiscard]] std::error_code open(std::string_view path, OpenMode mode) noexcept;

    // Write the whole buffer or fail
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close; reports errors the final flush surfaced
    std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    struct FileDeleter {
        void operator()(std::FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::unique_ptr<std::FILE, FileDeleter> file_;
    std::string path_;
};

// Map an errno value from a failed stdio call
[[nodiscard]] std::error_code errno_to_error(int err, DiskErrc fallback) noexcept;

} // namespace rangedl::disk
