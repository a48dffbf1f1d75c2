// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/disk/file_writer.hpp>
#include <hlsgrab/core/config.hpp>
#include <cerrno>
#include <utility>
#include <vector>

namespace hlsgrab::disk {

namespace {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:  return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:   return make_error_code(DiskErrc::access_denied);
        case ENOSPC:  return make_error_code(DiskErrc::disk_full);
        case EISDIR:
        case ENAMETOOLONG:
        case ENOTDIR: return make_error_code(DiskErrc::invalid_path);
        default:      return make_error_code(fallback);
    }
}

// Closes a read handle on scope exit
struct ReadHandle {
    std::FILE* ptr = nullptr;

    explicit ReadHandle(std::FILE* f) : ptr(f) {}
    ~ReadHandle() { if (ptr) std::fclose(ptr); }

    ReadHandle(const ReadHandle&) = delete;
    ReadHandle& operator=(const ReadHandle&) = delete;
};

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    (void)close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : file_(std::exchange(other.file_, nullptr))
    , path_(std::move(other.path_))
    , bytes_written_(std::exchange(other.bytes_written_, 0)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        (void)close();
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
        bytes_written_ = std::exchange(other.bytes_written_, 0);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::file_exists);
    }

    errno = 0;
    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        return from_errno(errno, DiskErrc::write_error);
    }

    path_ = path;
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    errno = 0;
    if (std::fwrite(data, 1, size, file_) != size) {
        return from_errno(errno, DiskErrc::write_error);
    }
    bytes_written_ += size;
    return {};
}

std::expected<std::uint64_t, std::error_code>
FileWriter::append_file(const std::filesystem::path& source) noexcept {
    if (!file_) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    errno = 0;
    ReadHandle in(std::fopen(source.c_str(), "rb"));
    if (!in.ptr) {
        return std::unexpected(from_errno(errno, DiskErrc::read_error));
    }

    std::vector<char> buffer;
    try {
        buffer.resize(core::WRITE_BUFFER_SIZE);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    std::uint64_t copied = 0;
    while (true) {
        auto n = std::fread(buffer.data(), 1, buffer.size(), in.ptr);
        if (n > 0) {
            if (auto ec = write(buffer.data(), n)) {
                return std::unexpected(ec);
            }
            copied += n;
        }
        if (n < buffer.size()) {
            if (std::ferror(in.ptr)) {
                return std::unexpected(make_error_code(DiskErrc::read_error));
            }
            break;
        }
    }
    return copied;
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (!file_) {
        return {};
    }
    std::error_code ec;
    errno = 0;
    if (std::fclose(file_) != 0) {
        ec = from_errno(errno, DiskErrc::write_error);
    }
    file_ = nullptr;
    return ec;
}

} // namespace hlsgrab::disk
