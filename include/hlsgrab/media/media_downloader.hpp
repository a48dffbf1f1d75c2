// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/media/assembler.hpp>
#include <hlsgrab/media/playlist_resolver.hpp>
#include <hlsgrab/media/remuxer.hpp>
#include <hlsgrab/media/segment_fetcher.hpp>
#include <hlsgrab/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace hlsgrab::media {

struct DownloadOptions {
    ResolverConfig resolver;
    FetchConfig fetch;
};

// What one run produced
struct DownloadReport {
    std::string playlist_url;
    std::optional<Variant> variant;
    std::filesystem::path output;
    bool muxed{false};
    std::uint32_t total_segments{0};
    std::uint32_t failed_segments{0};
    std::uint32_t used_segments{0};
    std::uint32_t hops{0};

    // Output written but some segments are missing
    [[nodiscard]] bool degraded() const noexcept { return failed_segments > 0; }

    // "success" or "degraded success, 1/10 segments missing"
    [[nodiscard]] std::string summary() const;
};

// Resolve -> fetch -> assemble for one playlist URL
class MediaDownloader {
public:
    MediaDownloader(core::Transport& transport, Remuxer& remuxer, DownloadOptions options = {});
    ~MediaDownloader();

    // Non-copyable
    MediaDownloader(const MediaDownloader&) = delete;
    MediaDownloader& operator=(const MediaDownloader&) = delete;

    // Resolution only, no segment is downloaded
    [[nodiscard]] std::expected<ResolvedPlaylist, MediaError>
    resolve(const std::string& playlist_url) const noexcept;

    [[nodiscard]] std::expected<DownloadReport, MediaError>
    run(const std::string& playlist_url, const std::filesystem::path& output) noexcept;

    // Set progress callback
    void callback(FetchCallback cb) noexcept { callback_ = std::move(cb); }

    // Stop claiming new segments; in-flight transfers finish
    void cancel() noexcept;

    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }

private:
    core::Transport& transport_;
    Remuxer& remuxer_;
    DownloadOptions options_;
    FetchCallback callback_;
    std::stop_source stop_;
};

// File name for a page URL: last path component, '+' and ' ' replaced by
// '_', ".mp4" appended. "video.mp4" when the URL has no usable path.
[[nodiscard]] std::string default_output_name(std::string_view url);

} // namespace hlsgrab::media
