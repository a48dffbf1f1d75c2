// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/media/playlist.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace hlsgrab::media {

// One media segment in playback order
struct Segment {
    std::string location;        // Absolute URL
    std::uint32_t ordinal{0};    // 1-based, authoritative over file names

    bool operator==(const Segment&) const = default;
};

// Decides whether a URI line of a media playlist is a segment
using SegmentFilter = std::function<bool(std::string_view uri)>;

// Default heuristic: ".ts" extension, a /segment, /chunk or /seg- path
// component, or a seg_<n> / chunk_<n> token.
[[nodiscard]] bool looks_like_segment(std::string_view uri) noexcept;

[[nodiscard]] SegmentFilter heuristic_segment_filter();

class SegmentExtractor {
public:
    explicit SegmentExtractor(SegmentFilter filter = heuristic_segment_filter());

    // Qualifying URI lines, resolved against the playlist directory and
    // numbered 1..N in document order. Empty if nothing qualifies.
    [[nodiscard]] std::vector<Segment>
    extract(const PlaylistDocument& document, std::string_view media_location) const;

private:
    SegmentFilter filter_;
};

} // namespace hlsgrab::media
