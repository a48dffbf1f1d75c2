// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/media/remuxer.hpp>
#include <hlsgrab/media/segment_fetcher.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace hlsgrab::media {

struct AssemblyResult {
    std::filesystem::path output;   // Final file actually written
    bool muxed{false};              // false = raw .ts concatenation, still needs a remux
    std::uint32_t segments_used{0};
    std::uint64_t bytes_written{0}; // Raw path only
    std::error_code remux_error;    // Why the remux path was abandoned
};

// Stitches a fetched batch into one file: remux through the tool first,
// raw byte concatenation when that fails. Missing slots are skipped and
// never renumbered.
class Assembler {
public:
    explicit Assembler(Remuxer& remuxer);

    [[nodiscard]] std::expected<AssemblyResult, std::error_code>
    assemble(const FetchBatch& batch, const std::filesystem::path& output) const noexcept;

    // Concat manifest text, one "file '<path>'" line per successful slot
    [[nodiscard]] static std::string build_manifest(const FetchBatch& batch);

    // output with its extension replaced by .ts
    [[nodiscard]] static std::filesystem::path fallback_path(const std::filesystem::path& output);

private:
    [[nodiscard]] std::error_code remux(const FetchBatch& batch,
                                        const std::filesystem::path& output) const noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    concatenate(const FetchBatch& batch, const std::filesystem::path& output) const noexcept;

    Remuxer& remuxer_;
};

} // namespace hlsgrab::media
