// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/config.hpp>
#include <hlsgrab/core/transport.hpp>
#include <hlsgrab/disk/scratch_dir.hpp>
#include <hlsgrab/media/playlist_resolver.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace hlsgrab::media {

// Outcome of one segment transfer. A failed slot keeps its ordinal and
// has no usable file.
struct FetchResult {
    Segment segment;
    std::filesystem::path local_path;
    bool success{false};
    std::error_code error;       // cancelled until the slot is attempted
    std::uint64_t bytes{0};
};

// Progress event, one per finished slot. `completed` is unique per event,
// but with several workers events can arrive out of order.
struct FetchProgress {
    std::uint32_t completed{0};
    std::uint32_t total{0};
    std::uint32_t ordinal{0};
    bool success{false};
};

// Called on the worker thread that finished the slot, possibly from several
// workers at once; it must be thread-safe.
using FetchCallback = std::function<void(const FetchProgress&)>;

struct FetchConfig {
    std::uint32_t concurrency{core::DEFAULT_CONCURRENCY};   // 1 = strictly sequential
    std::filesystem::path scratch_parent;                    // Empty = system temp dir
};

// Fetched slots plus the temporary directory holding them. The directory
// is removed when the batch is destroyed.
class FetchBatch {
public:
    FetchBatch(disk::ScratchDir directory, std::vector<FetchResult> results) noexcept;

    [[nodiscard]] const std::vector<FetchResult>& results() const noexcept { return results_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_.path(); }

    [[nodiscard]] std::uint32_t total() const noexcept { return static_cast<std::uint32_t>(results_.size()); }
    [[nodiscard]] std::uint32_t succeeded() const noexcept;
    [[nodiscard]] std::uint32_t failed() const noexcept { return total() - succeeded(); }

    // True if at least one slot was never attempted because of a stop request
    [[nodiscard]] bool cancelled() const noexcept;

private:
    disk::ScratchDir directory_;
    std::vector<FetchResult> results_;
};

class SegmentFetcher {
public:
    explicit SegmentFetcher(core::Transport& transport, FetchConfig config = {});

    // Fetch every segment into a fresh scratch directory. Per-segment
    // failures are recorded, not returned; only an empty playlist
    // (fetch_aborted) or an unusable temp dir fails the call.
    [[nodiscard]] std::expected<FetchBatch, std::error_code>
    fetch(const ResolvedPlaylist& playlist,
          std::stop_token stop = {},
          const FetchCallback& callback = {}) const noexcept;

    // segment_00001.ts
    [[nodiscard]] static std::string segment_file_name(std::uint32_t ordinal);

    [[nodiscard]] const FetchConfig& config() const noexcept { return config_; }

private:
    void fetch_one(FetchResult& slot, std::uint32_t total) const noexcept;

    core::Transport& transport_;
    FetchConfig config_;
};

} // namespace hlsgrab::media
