// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/settings.hpp>
#include <hlsgrab/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hlsgrab::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments. Unset optionals fall back to the settings file.
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_file;
    std::string remux_tool;
    std::optional<std::uint32_t> jobs;
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;   // Unusable arguments, reported by main
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings file (--config, else the default location) with flags applied.
// A missing default file is not an error.
[[nodiscard]] std::expected<core::Settings, std::error_code>
load_settings(const CliArgs& args) noexcept;

// Playlist URL for a page or playlist URL (see PageScanner::locate)
[[nodiscard]] std::expected<std::string, std::error_code>
find_playlist(core::Transport& transport, const std::string& url) noexcept;

// Download a single URL
[[nodiscard]] CliResult download(const std::string& url,
                                 const CliArgs& args,
                                 const core::Settings& settings) noexcept;

// Resolve and list variants and segments without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::Settings& settings) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace hlsgrab::cli
