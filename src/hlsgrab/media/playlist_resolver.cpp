// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/playlist_resolver.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace hlsgrab::media {

//=============================================================================
// ResolvedPlaylist
//=============================================================================

ResolvedPlaylist::ResolvedPlaylist(std::string source,
                                   std::string media_location,
                                   std::vector<Segment> segments,
                                   std::uint32_t hops,
                                   std::optional<Variant> variant,
                                   std::vector<Variant> variants)
    : source_(std::move(source))
    , media_location_(std::move(media_location))
    , segments_(std::move(segments))
    , hops_(hops)
    , variant_(std::move(variant))
    , variants_(std::move(variants)) {}

//=============================================================================
// PlaylistResolver
//=============================================================================

PlaylistResolver::PlaylistResolver(core::Transport& transport, ResolverConfig config)
    : transport_(transport)
    , config_(std::move(config))
    , extractor_(config_.segment_filter) {}

std::expected<ResolvedPlaylist, MediaError>
PlaylistResolver::resolve(const std::string& location) const noexcept {
    std::string current = location;
    std::optional<Variant> chosen;
    std::vector<Variant> variants;

    for (std::uint32_t hop = 1; hop <= config_.max_hops; ++hop) {
        spdlog::debug("Hop {}: fetching playlist {}", hop, current);

        auto response = transport_.get(current);
        if (!response) {
            spdlog::error("Could not fetch playlist {}: {}", current, response.error().message());
            return std::unexpected(MediaError{
                make_error_code(MediaErrc::playlist_fetch_error), hop, current, response.error()});
        }

        auto document = PlaylistParser::parse(response->body);
        if (!document) {
            return std::unexpected(MediaError{document.error(), hop, current, {}});
        }

        if (is_master_playlist(*document)) {
            variants = VariantSelector::collect(*document, current);
            auto variant = VariantSelector::select(*document, current);
            if (!variant) {
                return std::unexpected(MediaError{variant.error(), hop, current, {}});
            }

            spdlog::info("Master playlist with {} variant(s), selected {} @ {} bps",
                         variants.size(),
                         variant->resolution ? to_string(*variant->resolution) : "unknown",
                         variant->bandwidth);
            spdlog::debug("Variant URL: {}", variant->location);

            current = variant->location;
            chosen = std::move(*variant);
            continue;
        }

        auto segments = extractor_.extract(*document, current);
        if (segments.empty()) {
            return std::unexpected(MediaError{
                make_error_code(MediaErrc::no_segments_found), hop, current, {}});
        }

        spdlog::info("Found {} segment(s) after {} hop(s)", segments.size(), hop);
        return ResolvedPlaylist(location, current, std::move(segments), hop,
                                std::move(chosen), std::move(variants));
    }

    spdlog::error("Giving up after {} playlist hops at {}", config_.max_hops, current);
    return std::unexpected(MediaError{
        make_error_code(MediaErrc::playlist_loop_detected), config_.max_hops, current, {}});
}

} // namespace hlsgrab::media
