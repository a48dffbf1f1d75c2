// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/segment_extractor.hpp>
#include <hlsgrab/core/config.hpp>
#include <hlsgrab/core/url.hpp>
#include <cctype>
#include <regex>
#include <utility>

namespace hlsgrab::media {

bool looks_like_segment(std::string_view uri) noexcept {
    try {
        std::string lower;
        lower.reserve(uri.size());
        for (char c : uri) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        // Extension test ignores any query string (tokens, signatures)
        auto path = std::string_view(lower).substr(0, lower.find_first_of("?#"));
        if (path.ends_with(core::SEGMENT_FILE_EXTENSION)) {
            return true;
        }

        if (lower.find("/segment") != std::string::npos
            || lower.find("/chunk") != std::string::npos
            || lower.find("/seg-") != std::string::npos) {
            return true;
        }

        static const std::regex numbered_token(R"((seg|chunk)_\d+)");
        return std::regex_search(lower, numbered_token);
    } catch (const std::exception&) {
        return false;
    }
}

SegmentFilter heuristic_segment_filter() {
    return [](std::string_view uri) { return looks_like_segment(uri); };
}

SegmentExtractor::SegmentExtractor(SegmentFilter filter)
    : filter_(filter ? std::move(filter) : heuristic_segment_filter()) {}

std::vector<Segment>
SegmentExtractor::extract(const PlaylistDocument& document, std::string_view media_location) const {
    std::vector<Segment> segments;
    std::uint32_t ordinal = 0;

    for (const auto& line : document) {
        if (!line.is_uri() || !filter_(line.uri)) {
            continue;
        }
        segments.push_back(Segment{core::resolve_url(media_location, line.uri), ++ordinal});
    }

    return segments;
}

} // namespace hlsgrab::media
