// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace hlsgrab::core {

namespace {

// Collapse "." and ".." path segments (RFC 3986 section 5.2.4).
// Empty segments are kept, so "a//b" stays "a//b".
std::string remove_dot_segments(std::string_view path) {
    if (path.starts_with('/')) {
        path.remove_prefix(1);
    }

    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (true) {
        auto next = path.find('/', pos);
        const bool last = next == std::string_view::npos;
        auto part = path.substr(pos, last ? std::string_view::npos : next - pos);

        if (part == "..") {
            if (!out.empty()) out.pop_back();
            if (last) out.emplace_back();
        } else if (part == ".") {
            if (last) out.emplace_back();
        } else {
            out.push_back(part);
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result;
    for (std::size_t i = 0; i < out.size(); ++i) {
        result += '/';
        result += out[i];
    }
    if (result.empty()) {
        result = "/";
    }
    return result;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TransportErrc::invalid_url));
    }

    try {
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest_start = scheme_end + 3;

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        // A '?' or '#' before the first '/' ends the authority
        path_start = std::min({path_start, query_start, fragment_start});
        auto host_end = path_start;

        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end != std::string_view::npos && bracket_end < host_end) {
                url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
                auto ipv6_colon = url_str.find(':', bracket_end);
                if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
                    url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
                }
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (path_start < url_str.length() && url_str[path_start] == '/') {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(TransportErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    if (scheme_ == "sftp") return 22;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

std::string Url::directory() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return base() + "/";
    }
    return base() + path_.substr(0, last_slash + 1);
}

std::string Url::resolve(std::string_view reference) const {
    if (is_absolute_url(reference)) {
        return std::string(reference);
    }
    if (reference.starts_with("//")) {
        return scheme_ + ":" + std::string(reference);
    }

    // Split off the reference's query/fragment so dot removal only sees the path
    auto tail_pos = reference.find_first_of("?#");
    auto ref_path = reference.substr(0, tail_pos);
    std::string tail = tail_pos == std::string_view::npos
        ? std::string{}
        : std::string(reference.substr(tail_pos));

    if (ref_path.empty()) {
        // Same document: keep the base path, and the base query unless replaced
        std::string same = base() + path_;
        if (!tail.starts_with('?') && !query_.empty()) {
            same += "?" + query_;
        }
        return same + tail;
    }

    std::string merged;
    if (ref_path.starts_with("/")) {
        merged = std::string(ref_path);
    } else {
        auto last_slash = path_.rfind('/');
        merged = last_slash == std::string::npos ? "/" : path_.substr(0, last_slash + 1);
        merged += ref_path;
    }

    return base() + remove_dot_segments(merged) + tail;
}

bool is_absolute_url(std::string_view reference) noexcept {
    auto scheme_end = reference.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) return false;
    return std::all_of(reference.begin(), reference.begin() + static_cast<std::ptrdiff_t>(scheme_end),
        [](char c) {
            auto uc = static_cast<unsigned char>(c);
            return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
        });
}

std::string resolve_url(std::string_view base, std::string_view reference) {
    if (is_absolute_url(reference)) {
        return std::string(reference);
    }

    auto parsed = Url::parse(base);
    if (!parsed) {
        // Unparseable base: fall back to plain directory concatenation
        std::string dir(base.substr(0, base.find_first_of("?#")));
        auto last_slash = dir.rfind('/');
        dir = last_slash == std::string::npos ? std::string{} : dir.substr(0, last_slash + 1);
        return dir + std::string(reference);
    }
    return parsed->resolve(reference);
}

} // namespace hlsgrab::core
