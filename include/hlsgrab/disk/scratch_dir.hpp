// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/disk/error.hpp>
#include <expected>
#include <filesystem>
#include <string_view>

namespace hlsgrab::disk {

// Uniquely named temporary directory, removed with everything in it when
// the owner goes out of scope.
class ScratchDir {
public:
    // Create <parent>/<prefix>XXXXXX (parent defaults to the system temp dir)
    [[nodiscard]] static std::expected<ScratchDir, std::error_code>
    create(std::string_view prefix,
           const std::filesystem::path& parent = {}) noexcept;

    ScratchDir() = default;
    ~ScratchDir();

    // Non-copyable, movable
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }

    // Remove the directory now instead of at destruction
    void remove() noexcept;

private:
    explicit ScratchDir(std::filesystem::path path) noexcept : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace hlsgrab::disk
