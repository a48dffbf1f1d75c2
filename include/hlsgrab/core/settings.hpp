// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/config.hpp>
#include <hlsgrab/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace hlsgrab::core {

// User settings, optionally read from a JSON file:
//
//   {
//     "user_agent": "...",
//     "headers": { "Referer": "https://example.com/" },
//     "connect_timeout_sec": 10, "probe_timeout_sec": 5, "transfer_timeout_sec": 30,
//     "max_redirects": 10, "verify_tls": true,
//     "max_hops": 5, "concurrency": 4,
//     "remux_tool": "ffmpeg", "output_dir": "downloads"
//   }
//
// Missing keys keep their defaults, unknown keys are ignored.
struct Settings {
    TransportConfig transport;
    std::uint32_t max_hops{MAX_PLAYLIST_HOPS};
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::string remux_tool{DEFAULT_REMUX_TOOL};
    std::string output_dir{DEFAULT_OUTPUT_DIR};

    [[nodiscard]] static std::expected<Settings, std::error_code>
    parse(std::string_view json_text) noexcept;

    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    // $XDG_CONFIG_HOME/hlsgrab/config.json or ~/.config/hlsgrab/config.json
    // (empty if neither variable is set)
    [[nodiscard]] static std::filesystem::path default_path() noexcept;
};

} // namespace hlsgrab::core
