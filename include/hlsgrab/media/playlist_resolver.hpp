// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/config.hpp>
#include <hlsgrab/core/transport.hpp>
#include <hlsgrab/media/error.hpp>
#include <hlsgrab/media/segment_extractor.hpp>
#include <hlsgrab/media/variant_selector.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace hlsgrab::media {

// Terminal output of one resolution: the ordered segment list plus how it
// was reached. Read-only once built.
class ResolvedPlaylist {
public:
    ResolvedPlaylist(std::string source,
                     std::string media_location,
                     std::vector<Segment> segments,
                     std::uint32_t hops,
                     std::optional<Variant> variant,
                     std::vector<Variant> variants);

    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }

    // Location the resolution started from
    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    // Media playlist the segments came from
    [[nodiscard]] const std::string& media_location() const noexcept { return media_location_; }
    [[nodiscard]] std::uint32_t hops() const noexcept { return hops_; }
    // Chosen variant, if a master playlist was crossed
    [[nodiscard]] const std::optional<Variant>& variant() const noexcept { return variant_; }
    // Every variant of the last master playlist crossed
    [[nodiscard]] const std::vector<Variant>& variants() const noexcept { return variants_; }

private:
    std::string source_;
    std::string media_location_;
    std::vector<Segment> segments_;
    std::uint32_t hops_{0};
    std::optional<Variant> variant_;
    std::vector<Variant> variants_;
};

struct ResolverConfig {
    std::uint32_t max_hops{core::MAX_PLAYLIST_HOPS};
    SegmentFilter segment_filter;   // Empty means heuristic_segment_filter()
};

// Playlist location -> ordered segment list, following master playlists
// through their best variant.
class PlaylistResolver {
public:
    explicit PlaylistResolver(core::Transport& transport, ResolverConfig config = {});

    [[nodiscard]] std::expected<ResolvedPlaylist, MediaError>
    resolve(const std::string& location) const noexcept;

    [[nodiscard]] const ResolverConfig& config() const noexcept { return config_; }

private:
    core::Transport& transport_;
    ResolverConfig config_;
    SegmentExtractor extractor_;
};

} // namespace hlsgrab::media
