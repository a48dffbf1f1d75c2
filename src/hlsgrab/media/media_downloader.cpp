// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/media_downloader.hpp>
#include <hlsgrab/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace hlsgrab::media {

//=============================================================================
// DownloadReport
//=============================================================================

std::string DownloadReport::summary() const {
    if (!degraded()) {
        return "success";
    }
    return "degraded success, " + std::to_string(failed_segments) + "/" +
           std::to_string(total_segments) + " segments missing";
}

//=============================================================================
// MediaDownloader
//=============================================================================

MediaDownloader::MediaDownloader(core::Transport& transport, Remuxer& remuxer, DownloadOptions options)
    : transport_(transport)
    , remuxer_(remuxer)
    , options_(std::move(options)) {}

MediaDownloader::~MediaDownloader() {
    cancel();
}

void MediaDownloader::cancel() noexcept {
    stop_.request_stop();
}

std::expected<ResolvedPlaylist, MediaError>
MediaDownloader::resolve(const std::string& playlist_url) const noexcept {
    PlaylistResolver resolver(transport_, options_.resolver);
    return resolver.resolve(playlist_url);
}

std::expected<DownloadReport, MediaError>
MediaDownloader::run(const std::string& playlist_url, const std::filesystem::path& output) noexcept {
    auto playlist = resolve(playlist_url);
    if (!playlist) {
        return std::unexpected(playlist.error());
    }

    if (stop_.stop_requested()) {
        return std::unexpected(MediaError{make_error_code(MediaErrc::cancelled), 0, playlist_url, {}});
    }

    SegmentFetcher fetcher(transport_, options_.fetch);
    auto batch = fetcher.fetch(*playlist, stop_.get_token(), callback_);
    if (!batch) {
        // fetch_aborted, or the scratch directory could not be created
        if (batch.error().category() == media_errc_category()) {
            return std::unexpected(MediaError{batch.error(), 0, playlist->media_location(), {}});
        }
        return std::unexpected(MediaError{
            make_error_code(MediaErrc::fetch_aborted), 0, playlist->media_location(), batch.error()});
    }

    if (batch->cancelled()) {
        return std::unexpected(MediaError{make_error_code(MediaErrc::cancelled), 0, playlist_url, {}});
    }

    Assembler assembler(remuxer_);
    auto assembled = assembler.assemble(*batch, output);
    if (!assembled) {
        // With nothing fetched, the first transfer error explains why
        std::error_code cause;
        if (batch->succeeded() == 0 && !batch->results().empty()) {
            cause = batch->results().front().error;
        }
        return std::unexpected(MediaError{assembled.error(), 0, output.string(), cause});
    }

    DownloadReport report;
    report.playlist_url = playlist_url;
    report.variant = playlist->variant();
    report.output = assembled->output;
    report.muxed = assembled->muxed;
    report.total_segments = batch->total();
    report.failed_segments = batch->failed();
    report.used_segments = assembled->segments_used;
    report.hops = playlist->hops();

    if (report.degraded()) {
        spdlog::warn("{}", report.summary());
    }
    return report;
}

//=============================================================================
// Helpers
//=============================================================================

std::string default_output_name(std::string_view url) {
    std::string path;
    if (auto parsed = core::Url::parse(url)) {
        path = parsed->path();
    } else {
        path = std::string(url);
        if (auto q = path.find_first_of("?#"); q != std::string::npos) {
            path.erase(q);
        }
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty()) {
        return "video.mp4";
    }

    std::replace(name.begin(), name.end(), '+', '_');
    std::replace(name.begin(), name.end(), ' ', '_');
    if (!name.ends_with(".mp4")) {
        name += ".mp4";
    }
    return name;
}

} // namespace hlsgrab::media
