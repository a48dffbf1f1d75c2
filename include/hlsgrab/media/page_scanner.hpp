// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/transport.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hlsgrab::media {

// Finds playlist URLs in a web page
class PageScanner {
public:
    // URL already names a playlist (.m3u8 path, with or without query)
    [[nodiscard]] static bool is_playlist_url(std::string_view url) noexcept;

    // Content-Type names an HLS playlist (parameters ignored)
    [[nodiscard]] static bool is_playlist_content_type(std::string_view content_type) noexcept;

    // Playlist URLs in page order, duplicates removed. Quoted absolute URLs
    // come first, then bare absolute URLs, then <source src> references
    // resolved against page_url.
    [[nodiscard]] static std::vector<std::string>
    extract_playlist_urls(std::string_view page_content, std::string_view page_url) noexcept;

    // Playlist URL for a page or playlist URL. A URL that looks like a
    // playlist is returned as-is. Otherwise a HEAD request checks whether it
    // serves a playlist anyway; if not, the page is fetched and scanned.
    // A failed HEAD falls through to the scan.
    [[nodiscard]] static std::expected<std::string, std::error_code>
    locate(core::Transport& transport, const std::string& url) noexcept;
};

} // namespace hlsgrab::media
