// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/media/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hlsgrab::media {

constexpr std::string_view TAG_STREAM_INF = "EXT-X-STREAM-INF";

enum class LineKind : std::uint8_t {
    directive,   // "#TAG" or "#TAG:attributes"
    uri
};

using AttributeMap = std::map<std::string, std::string, std::less<>>;

// One non-blank line of a playlist, in document order
struct PlaylistLine {
    LineKind kind{LineKind::uri};
    std::string tag;              // Directive name without '#', e.g. "EXT-X-STREAM-INF"
    std::string raw_attributes;   // Everything after the first ':'
    AttributeMap attributes;      // KEY=VALUE pairs, quotes stripped
    std::string uri;              // URI lines only

    [[nodiscard]] bool is_directive() const noexcept { return kind == LineKind::directive; }
    [[nodiscard]] bool is_uri() const noexcept { return kind == LineKind::uri; }

    // Attribute value, empty if absent
    [[nodiscard]] std::string_view attribute(std::string_view key) const noexcept;

    bool operator==(const PlaylistLine&) const = default;
};

using PlaylistDocument = std::vector<PlaylistLine>;

// M3U8 text -> ordered lines. Pure; never touches the network.
class PlaylistParser {
public:
    // Fails with malformed_playlist only for empty (or whitespace-only) input.
    // Unknown directives are kept verbatim.
    [[nodiscard]] static std::expected<PlaylistDocument, std::error_code>
    parse(std::string_view content) noexcept;

    // Split `A=1,B="x,y",C=z` into a map. Items without '=' are skipped.
    [[nodiscard]] static AttributeMap parse_attributes(std::string_view text);
};

// A document with at least one stream-variant directive is a master playlist
[[nodiscard]] bool is_master_playlist(const PlaylistDocument& document) noexcept;

} // namespace hlsgrab::media
