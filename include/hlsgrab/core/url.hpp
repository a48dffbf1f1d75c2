// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace hlsgrab::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    // scheme://host[:port]/dir/ (always ends with '/')
    [[nodiscard]] std::string directory() const;

    // Resolve a playlist reference against this URL
    [[nodiscard]] std::string resolve(std::string_view reference) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// True if the reference carries its own scheme (http://, https://, ...)
[[nodiscard]] bool is_absolute_url(std::string_view reference) noexcept;

// Resolve `reference` against `base`. Absolute references pass through,
// "//host/.." takes the base scheme, "/path" takes the base origin and
// anything else is appended to the base directory. Dot segments are removed.
[[nodiscard]] std::string resolve_url(std::string_view base, std::string_view reference);

} // namespace hlsgrab::core
