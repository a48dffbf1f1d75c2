// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/variant_selector.hpp>
#include <hlsgrab/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace hlsgrab::media {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool is_subtitle_variant(const PlaylistLine& directive, std::string_view uri) {
    auto type = to_lower(directive.attribute("TYPE"));
    if (type == "subtitles" || type == "closed-captions") {
        return true;
    }
    auto lower_uri = to_lower(uri);
    return lower_uri.find("caption") != std::string::npos
        || lower_uri.find("subtitle") != std::string::npos;
}

} // namespace

std::vector<Variant>
VariantSelector::collect(const PlaylistDocument& document, std::string_view master_location) {
    std::vector<Variant> variants;

    for (std::size_t i = 0; i + 1 < document.size(); ++i) {
        const auto& line = document[i];
        if (!line.is_directive() || line.tag != TAG_STREAM_INF) {
            continue;
        }
        // Blank lines are already gone, so the URI must be the very next line
        const auto& next = document[i + 1];
        if (!next.is_uri()) {
            continue;
        }

        Variant variant;
        variant.bandwidth = parse_number<std::uint64_t>(line.attribute("BANDWIDTH")).value_or(0);
        variant.resolution = parse_resolution(line.attribute("RESOLUTION"));
        variant.location = core::resolve_url(master_location, next.uri);
        variant.is_subtitle = is_subtitle_variant(line, next.uri);
        variants.push_back(std::move(variant));
    }

    return variants;
}

std::expected<Variant, std::error_code>
VariantSelector::select(const PlaylistDocument& document, std::string_view master_location) noexcept {
    auto variants = collect(document, master_location);

    const Variant* best = nullptr;
    for (const auto& variant : variants) {
        if (variant.is_subtitle) {
            continue;
        }
        // Strictly greater keeps the earliest of equal bandwidths
        if (!best || variant.bandwidth > best->bandwidth) {
            best = &variant;
        }
    }

    if (!best) {
        return std::unexpected(make_error_code(MediaErrc::no_eligible_variant));
    }
    return *best;
}

std::optional<Resolution> VariantSelector::parse_resolution(std::string_view text) noexcept {
    auto x = text.find_first_of("xX");
    if (x == std::string_view::npos) {
        return std::nullopt;
    }
    auto width = parse_number<std::uint32_t>(text.substr(0, x));
    auto height = parse_number<std::uint32_t>(text.substr(x + 1));
    if (!width || !height) {
        return std::nullopt;
    }
    return Resolution{*width, *height};
}

std::string to_string(const Resolution& resolution) {
    return std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
}

} // namespace hlsgrab::media
