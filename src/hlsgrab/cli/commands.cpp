// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/cli/commands.hpp>
#include <hlsgrab/cli/progress_bar.hpp>
#include <hlsgrab/core/http_session.hpp>
#include <hlsgrab/core/log.hpp>
#include <hlsgrab/media/media_downloader.hpp>
#include <hlsgrab/media/page_scanner.hpp>
#include <hlsgrab/media/remuxer.hpp>
#include <hlsgrab/version.hpp>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <mutex>

using namespace hlsgrab::core;
using namespace hlsgrab::media;

namespace hlsgrab::cli {

namespace {

std::optional<std::uint32_t> parse_count(std::string_view text) noexcept {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

DownloadOptions make_options(const Settings& settings) {
    DownloadOptions options;
    options.resolver.max_hops = settings.max_hops;
    options.fetch.concurrency = settings.concurrency;
    return options;
}

void print_failure(const MediaError& error) {
    std::cout << "Error: " << error.message() << std::endl;
    if (error.code == MediaErrc::no_eligible_variant || error.code == MediaErrc::playlist_loop_detected) {
        std::cout << "Try passing a media playlist URL directly" << std::endl;
    }
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    // Value of an option that takes one, or nullptr (recorded as an error)
    auto value_of = [&](int& i, const std::string& flag) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.errors.push_back("Missing value for " + flag);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose" || arg == "--debug") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.list_only = true;
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (const char* v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value_of(i, arg)) args.config_file = v;
        } else if (arg == "--remux-tool") {
            if (const char* v = value_of(i, arg)) args.remux_tool = v;
        } else if (arg == "-j" || arg == "--jobs") {
            if (const char* v = value_of(i, arg)) {
                args.jobs = parse_count(v);
                if (!args.jobs) {
                    args.errors.push_back("Invalid job count: " + std::string(v));
                }
            }
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            args.urls.push_back(arg);
        } else {
            args.errors.push_back("Unknown argument: " + arg);
        }
    }

    return args;
}

//=============================================================================
// Settings
//=============================================================================

std::expected<Settings, std::error_code> load_settings(const CliArgs& args) noexcept {
    Settings settings;

    if (!args.config_file.empty()) {
        auto loaded = Settings::load(args.config_file);
        if (!loaded) {
            spdlog::error("Could not load {}: {}", args.config_file, loaded.error().message());
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    } else if (auto path = Settings::default_path(); !path.empty()) {
        auto loaded = Settings::load(path);
        if (loaded) {
            spdlog::debug("Loaded settings from {}", path.string());
            settings = std::move(*loaded);
        } else if (loaded.error() != ConfigErrc::file_not_found) {
            spdlog::error("Could not load {}: {}", path.string(), loaded.error().message());
            return std::unexpected(loaded.error());
        }
    }

    if (args.jobs) {
        settings.concurrency = std::min(*args.jobs, MAX_CONCURRENCY);
    }
    if (!args.remux_tool.empty()) {
        settings.remux_tool = args.remux_tool;
    }
    if (!args.output_dir.empty()) {
        settings.output_dir = args.output_dir;
    }
    return settings;
}

std::expected<std::string, std::error_code>
find_playlist(Transport& transport, const std::string& url) noexcept {
    return PageScanner::locate(transport, url);
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& url, const CliArgs& args, const Settings& settings) noexcept {
    HttpSession session(settings.transport);

    auto playlist_url = find_playlist(session, url);
    if (!playlist_url) {
        std::cout << "Error: No playlist found for " << url << std::endl;
        std::cout << "The page may load its video dynamically; pass the .m3u8 URL instead" << std::endl;
        return std::unexpected(playlist_url.error());
    }

    std::filesystem::path output_dir = settings.output_dir;
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cout << "Error: Cannot create " << output_dir.string() << ": " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    std::filesystem::path output = output_dir /
        (args.output_file.empty() ? default_output_name(url) : args.output_file);

    if (args.verbose) {
        std::cout << "Playlist: " << *playlist_url << std::endl;
        std::cout << "Output path: " << output.string() << std::endl;
    }

    FfmpegRemuxer remuxer(settings.remux_tool);
    MediaDownloader downloader(session, remuxer, make_options(settings));

    ProgressBar bar(0, "Segments");
    std::mutex bar_mutex;
    std::uint32_t completed = 0;
    std::uint32_t failed = 0;
    if (!args.quiet) {
        // Workers report concurrently and possibly out of order
        downloader.callback([&](const FetchProgress& p) {
            std::lock_guard lock(bar_mutex);
            bar.total(p.total);
            completed = std::max(completed, p.completed);
            if (!p.success) {
                ++failed;
            }
            bar.update(completed, failed);
        });
    }

    auto report = downloader.run(*playlist_url, output);
    if (!args.quiet) {
        bar.finish();
    }

    if (!report) {
        print_failure(report.error());
        return std::unexpected(report.error().code);
    }

    std::cout << "Saved " << report->output.string() << " (" << report->summary() << ")" << std::endl;
    if (!report->muxed) {
        std::cout << "Note: segments were joined without remuxing. To convert, run:" << std::endl;
        std::cout << "  ffmpeg -i " << report->output.string() << " -c copy "
                  << output.string() << std::endl;
    }
    return 0;
}

CliResult info(const std::string& url, const Settings& settings) noexcept {
    HttpSession session(settings.transport);

    auto playlist_url = find_playlist(session, url);
    if (!playlist_url) {
        std::cout << "Error: No playlist found for " << url << std::endl;
        return std::unexpected(playlist_url.error());
    }

    FfmpegRemuxer remuxer(settings.remux_tool);
    MediaDownloader downloader(session, remuxer, make_options(settings));

    auto playlist = downloader.resolve(*playlist_url);
    if (!playlist) {
        print_failure(playlist.error());
        return std::unexpected(playlist.error().code);
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Playlist: " << playlist->source() << std::endl;
    std::cout << "Media playlist: " << playlist->media_location() << std::endl;
    std::cout << "Hops: " << playlist->hops() << std::endl;

    if (!playlist->variants().empty()) {
        std::cout << "Variants:" << std::endl;
        for (const auto& v : playlist->variants()) {
            bool chosen = playlist->variant() && *playlist->variant() == v;
            std::cout << (chosen ? "  * " : "    ") << v.bandwidth << " bps";
            if (v.resolution) {
                std::cout << "  " << to_string(*v.resolution);
            }
            if (v.is_subtitle) {
                std::cout << "  (subtitles)";
            }
            std::cout << "  " << v.location << std::endl;
        }
    }

    std::cout << "Segments: " << playlist->size() << std::endl;
    for (const auto& segment : playlist->segments()) {
        std::cout << "  " << segment.ordinal << ": " << segment.location << std::endl;
    }

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "hlsgrab " << program_name << " - HLS stream downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "  URL is a page embedding a video, or an .m3u8 playlist.\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose, --debug  Enable debug output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -o, --output <FILE>     Output file name (default: from URL)\n";
    std::cout << "  -d, --directory <DIR>   Output directory (default: " << DEFAULT_OUTPUT_DIR << ")\n";
    std::cout << "  -j, --jobs <N>          Parallel segment downloads (default: " << DEFAULT_CONCURRENCY << ")\n";
    std::cout << "  -c, --config <FILE>     Settings file (JSON)\n";
    std::cout << "      --remux-tool <BIN>  Remux tool (default: " << DEFAULT_REMUX_TOOL << ")\n";
    std::cout << "  -i, --info              Show variants and segments without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/video/1_abc/Lecture+One\n";
    std::cout << "  " << program_name << " -o talk.mp4 https://cdn.example.com/hls/master.m3u8\n";
    std::cout << "  " << program_name << " -i https://cdn.example.com/hls/master.m3u8\n";
}

void print_version() noexcept {
    std::cout << "hlsgrab " << hlsgrab::version.to_string() << std::endl;
    std::cout << "Built " << hlsgrab::BUILD_DATE << " " << hlsgrab::BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace hlsgrab::cli
