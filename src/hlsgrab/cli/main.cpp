// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/cli/commands.hpp>
#include <hlsgrab/core/http_session.hpp>
#include <hlsgrab/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace hlsgrab::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void hlsgrab_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(hlsgrab_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    hlsgrab::core::init_logging(args.verbose ? hlsgrab::core::Verbosity::verbose
                               : args.quiet  ? hlsgrab::core::Verbosity::quiet
                                             : hlsgrab::core::Verbosity::normal);

    auto settings = load_settings(args);
    if (!settings) {
        std::cerr << "Error: Invalid settings: " << settings.error().message() << std::endl;
        return 1;
    }

    hlsgrab::core::HttpSession::global_init();

    int exit_code = 0;
    for (const auto& url : args.urls) {
        // One -o name cannot serve several URLs
        CliArgs per_url = args;
        if (args.urls.size() > 1) {
            per_url.output_file.clear();
        }

        auto result = args.list_only ? info(url, *settings) : download(url, per_url, *settings);
        if (!result) {
            exit_code = 1;
        }
    }

    hlsgrab::core::HttpSession::global_cleanup();
    return exit_code;
}
