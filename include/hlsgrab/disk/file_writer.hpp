// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <filesystem>

namespace hlsgrab::disk {

// Sequential binary writer. Used both as the sink of a segment transfer
// and as the output of raw concatenation.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (and truncate) file for writing
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append data at the current end
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Append the whole content of another file, returns bytes copied
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    append_file(const std::filesystem::path& source) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Close file (safe to call twice)
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
};

} // namespace hlsgrab::disk
