// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/page_scanner.hpp>
#include <hlsgrab/core/url.hpp>
#include <hlsgrab/media/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <array>
#include <regex>

namespace hlsgrab::media {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void add_unique(std::vector<std::string>& urls, std::string url) {
    if (std::find(urls.begin(), urls.end(), url) == urls.end()) {
        urls.push_back(std::move(url));
    }
}

constexpr std::array<std::string_view, 4> PLAYLIST_CONTENT_TYPES = {
    "application/vnd.apple.mpegurl",
    "application/x-mpegurl",
    "audio/mpegurl",
    "audio/x-mpegurl",
};

} // namespace

bool PageScanner::is_playlist_content_type(std::string_view content_type) noexcept {
    try {
        auto lower = to_lower(content_type.substr(0, content_type.find(';')));
        auto first = lower.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return false;
        }
        auto last = lower.find_last_not_of(" \t");
        std::string_view type(lower.data() + first, last - first + 1);
        return std::find(PLAYLIST_CONTENT_TYPES.begin(), PLAYLIST_CONTENT_TYPES.end(), type)
            != PLAYLIST_CONTENT_TYPES.end();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::expected<std::string, std::error_code>
PageScanner::locate(core::Transport& transport, const std::string& url) noexcept {
    if (is_playlist_url(url)) {
        return url;
    }

    if (auto head = transport.head(url)) {
        if (is_playlist_content_type(head->content_type)) {
            spdlog::debug("{} serves a playlist ({})", url, head->content_type);
            return url;
        }
    } else {
        spdlog::debug("HEAD {} failed: {}", url, head.error().message());
    }

    spdlog::info("Scanning page for a playlist: {}", url);
    auto page = transport.get(url);
    if (!page) {
        spdlog::error("Could not fetch page {}: {}", url, page.error().message());
        return std::unexpected(page.error());
    }

    if (is_playlist_content_type(page->content_type)) {
        return url;
    }

    auto found = extract_playlist_urls(page->body, url);
    if (found.empty()) {
        spdlog::error("No playlist URL found in {}", url);
        return std::unexpected(make_error_code(MediaErrc::playlist_fetch_error));
    }

    if (found.size() > 1) {
        spdlog::debug("{} candidate playlists, using the first", found.size());
    }
    return found.front();
}

bool PageScanner::is_playlist_url(std::string_view url) noexcept {
    try {
        auto lower = to_lower(url);
        std::string_view view(lower);
        return view.ends_with(".m3u8")
            || view.find(".m3u8?") != std::string_view::npos
            || view.find("/a.m3u8") != std::string_view::npos;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::vector<std::string>
PageScanner::extract_playlist_urls(std::string_view page_content, std::string_view page_url) noexcept {
    std::vector<std::string> urls;

    try {
        static const std::vector<std::regex> absolute_patterns = {
            std::regex(R"re("(https?://[^"]+\.m3u8[^"]*)")re", std::regex::icase),
            std::regex(R"re('(https?://[^']+\.m3u8[^']*)')re", std::regex::icase),
            std::regex(R"re((https?://[^\s<>"']+\.m3u8[^\s<>"']*))re", std::regex::icase),
        };
        static const std::regex source_pattern(
            R"re(<source[^>]+src=["']([^"']+)["'])re", std::regex::icase);

        const auto* begin = page_content.data();
        const auto* end = page_content.data() + page_content.size();

        for (const auto& pattern : absolute_patterns) {
            for (std::cregex_iterator it(begin, end, pattern), last; it != last; ++it) {
                add_unique(urls, (*it)[1].str());
            }
        }

        for (std::cregex_iterator it(begin, end, source_pattern), last; it != last; ++it) {
            auto src = (*it)[1].str();
            if (to_lower(src).find(".m3u8") == std::string::npos) {
                continue;
            }
            add_unique(urls, core::resolve_url(page_url, src));
        }
    } catch (const std::exception& e) {
        spdlog::warn("Page scan failed: {}", e.what());
        return {};
    }

    spdlog::debug("Page scan found {} playlist URL(s)", urls.size());
    return urls;
}

} // namespace hlsgrab::media
