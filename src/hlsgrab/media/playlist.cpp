// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/playlist.hpp>
#include <algorithm>

namespace hlsgrab::media {

namespace {

constexpr char DIRECTIVE_PREFIX = '#';
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

PlaylistLine make_directive(std::string_view line) {
    PlaylistLine out;
    out.kind = LineKind::directive;

    auto body = line.substr(1);
    auto colon = body.find(':');
    if (colon == std::string_view::npos) {
        out.tag = std::string(trim(body));
        return out;
    }

    out.tag = std::string(trim(body.substr(0, colon)));
    out.raw_attributes = std::string(body.substr(colon + 1));
    out.attributes = PlaylistParser::parse_attributes(out.raw_attributes);
    return out;
}

} // namespace

std::string_view PlaylistLine::attribute(std::string_view key) const noexcept {
    auto it = attributes.find(key);
    return it == attributes.end() ? std::string_view{} : std::string_view(it->second);
}

std::expected<PlaylistDocument, std::error_code>
PlaylistParser::parse(std::string_view content) noexcept {
    if (content.starts_with(UTF8_BOM)) {
        content.remove_prefix(UTF8_BOM.size());
    }
    if (trim(content).empty()) {
        return std::unexpected(make_error_code(MediaErrc::malformed_playlist));
    }

    PlaylistDocument document;
    try {
        std::size_t pos = 0;
        while (pos < content.size()) {
            auto end = content.find_first_of("\r\n", pos);
            if (end == std::string_view::npos) end = content.size();

            auto line = trim(content.substr(pos, end - pos));
            pos = end + 1;

            if (line.empty()) {
                continue;
            }

            if (line.front() == DIRECTIVE_PREFIX) {
                document.push_back(make_directive(line));
            } else {
                PlaylistLine uri_line;
                uri_line.uri = std::string(line);
                document.push_back(std::move(uri_line));
            }
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    return document;
}

AttributeMap PlaylistParser::parse_attributes(std::string_view text) {
    AttributeMap attributes;

    std::size_t pos = 0;
    while (pos < text.size()) {
        // Find the end of this item, skipping commas inside quotes
        std::size_t end = pos;
        bool in_quotes = false;
        while (end < text.size()) {
            char c = text[end];
            if (c == '"') {
                in_quotes = !in_quotes;
            } else if (c == ',' && !in_quotes) {
                break;
            }
            ++end;
        }

        auto item = trim(text.substr(pos, end - pos));
        pos = end + 1;

        auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            continue;  // e.g. the duration of #EXTINF:10.0,
        }

        auto key = trim(item.substr(0, eq));
        auto value = trim(item.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) {
            attributes.insert_or_assign(std::string(key), std::string(value));
        }
    }

    return attributes;
}

bool is_master_playlist(const PlaylistDocument& document) noexcept {
    return std::any_of(document.begin(), document.end(), [](const PlaylistLine& line) {
        return line.is_directive() && line.tag == TAG_STREAM_INF;
    });
}

} // namespace hlsgrab::media
