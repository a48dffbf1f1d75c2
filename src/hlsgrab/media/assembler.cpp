// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/assembler.hpp>
#include <hlsgrab/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace hlsgrab::media {

namespace {

// Single-quote a path for the concat demuxer: ' becomes '\''
std::string quote_path(const std::string& path) {
    std::string quoted;
    quoted.reserve(path.size() + 2);
    quoted += '\'';
    for (char c : path) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

void discard(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

Assembler::Assembler(Remuxer& remuxer)
    : remuxer_(remuxer) {}

std::string Assembler::build_manifest(const FetchBatch& batch) {
    std::string manifest;
    for (const auto& slot : batch.results()) {
        if (!slot.success) {
            continue;
        }
        auto absolute = slot.local_path.is_absolute()
            ? slot.local_path
            : std::filesystem::absolute(slot.local_path);
        manifest += "file " + quote_path(absolute.string()) + "\n";
    }
    return manifest;
}

std::filesystem::path Assembler::fallback_path(const std::filesystem::path& output) {
    auto path = output;
    path.replace_extension(core::SEGMENT_FILE_EXTENSION);
    return path;
}

std::expected<AssemblyResult, std::error_code>
Assembler::assemble(const FetchBatch& batch, const std::filesystem::path& output) const noexcept {
    const auto used = batch.succeeded();
    if (used == 0) {
        spdlog::error("No segments were downloaded, nothing to assemble");
        return std::unexpected(make_error_code(MediaErrc::assembly_failure));
    }

    AssemblyResult result;
    result.segments_used = used;

    // Strategy 1: stream-copy remux
    auto remux_ec = remux(batch, output);
    if (!remux_ec) {
        result.output = output;
        result.muxed = true;
        spdlog::info("Remuxed {} segment(s) into {}", used, output.string());
        return result;
    }

    // Strategy 2: raw byte concatenation
    result.remux_error = remux_ec;
    spdlog::warn("Remux unavailable ({}), falling back to raw concatenation", remux_ec.message());

    auto raw_output = fallback_path(output);
    auto bytes = concatenate(batch, raw_output);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    result.output = std::move(raw_output);
    result.muxed = false;
    result.bytes_written = *bytes;
    spdlog::info("Concatenated {} segment(s) into {} ({} bytes)",
                 used, result.output.string(), *bytes);
    return result;
}

std::error_code Assembler::remux(const FetchBatch& batch,
                                 const std::filesystem::path& output) const noexcept {
    try {
        const auto manifest_path = batch.directory() / core::CONCAT_MANIFEST_NAME;
        {
            std::ofstream manifest(manifest_path, std::ios::binary | std::ios::trunc);
            if (!manifest) {
                spdlog::warn("Could not write {}", manifest_path.string());
                return make_error_code(disk::DiskErrc::write_error);
            }
            manifest << build_manifest(batch);
            if (!manifest.flush()) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        // A stale file must not pass for a fresh remux
        discard(output);

        auto ec = remuxer_.concat(manifest_path, output);
        if (ec) {
            discard(output);
            return ec;
        }

        std::error_code exists_ec;
        if (!std::filesystem::exists(output, exists_ec)) {
            spdlog::warn("Remux reported success but {} is missing", output.string());
            return make_error_code(MediaErrc::remux_failed);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::warn("Remux setup failed: {}", e.what());
        return make_error_code(MediaErrc::remux_failed);
    }
}

std::expected<std::uint64_t, std::error_code>
Assembler::concatenate(const FetchBatch& batch, const std::filesystem::path& output) const noexcept {
    disk::FileWriter writer;
    if (auto ec = writer.open(output)) {
        spdlog::error("Could not create {}: {}", output.string(), ec.message());
        return std::unexpected(ec);
    }

    for (const auto& slot : batch.results()) {
        if (!slot.success) {
            continue;
        }
        auto appended = writer.append_file(slot.local_path);
        if (!appended) {
            const auto& ec = appended.error();
            if (ec != disk::DiskErrc::file_not_found && ec != disk::DiskErrc::read_error) {
                spdlog::error("Writing {} failed: {}", output.string(), ec.message());
                (void)writer.close();
                discard(output);
                return std::unexpected(ec);
            }
            // A vanished segment is skipped like a failed one
            spdlog::warn("Skipping segment {}: {}", slot.segment.ordinal, ec.message());
        }
    }

    const auto bytes = writer.bytes_written();
    if (auto ec = writer.close()) {
        discard(output);
        return std::unexpected(ec);
    }

    if (bytes == 0) {
        spdlog::error("Raw concatenation produced no data");
        discard(output);
        return std::unexpected(make_error_code(MediaErrc::assembly_failure));
    }
    return bytes;
}

} // namespace hlsgrab::media
