// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/disk/scratch_dir.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace hlsgrab::disk {

std::expected<ScratchDir, std::error_code>
ScratchDir::create(std::string_view prefix, const std::filesystem::path& parent) noexcept {
    try {
        std::error_code ec;
        std::filesystem::path base = parent.empty()
            ? std::filesystem::temp_directory_path(ec)
            : parent;
        if (ec) {
            return std::unexpected(make_error_code(DiskErrc::invalid_path));
        }

        std::string pattern = (base / std::string(prefix)).string() + "XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        errno = 0;
        if (::mkdtemp(buffer.data()) == nullptr) {
            return std::unexpected(errno == EACCES
                ? make_error_code(DiskErrc::access_denied)
                : make_error_code(DiskErrc::create_dir_failed));
        }

        return ScratchDir(std::filesystem::path(buffer.data()));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::create_dir_failed));
    }
}

ScratchDir::~ScratchDir() {
    remove();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScratchDir::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Could not remove temporary directory {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("Removed temporary directory {}", path_.string());
    }
    path_.clear();
}

} // namespace hlsgrab::disk
