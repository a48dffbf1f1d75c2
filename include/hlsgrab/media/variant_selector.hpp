// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/media/playlist.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hlsgrab::media {

struct Resolution {
    std::uint32_t width{0};
    std::uint32_t height{0};

    bool operator==(const Resolution&) const = default;
};

// One EXT-X-STREAM-INF entry of a master playlist
struct Variant {
    std::uint64_t bandwidth{0};            // bps, 0 if not declared
    std::optional<Resolution> resolution;
    std::string location;                  // Resolved against the master playlist
    bool is_subtitle{false};               // Never eligible for selection

    bool operator==(const Variant&) const = default;
};

class VariantSelector {
public:
    // All stream-variant directives immediately followed by a URI line
    [[nodiscard]] static std::vector<Variant>
    collect(const PlaylistDocument& document, std::string_view master_location);

    // Highest bandwidth among non-subtitle variants; the first declared wins a tie
    [[nodiscard]] static std::expected<Variant, std::error_code>
    select(const PlaylistDocument& document, std::string_view master_location) noexcept;

    // "1280x720" -> {1280, 720}
    [[nodiscard]] static std::optional<Resolution> parse_resolution(std::string_view text) noexcept;
};

[[nodiscard]] std::string to_string(const Resolution& resolution);

} // namespace hlsgrab::media
