// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hlsgrab::core {

namespace {

constexpr const char* LOGGER_NAME = "hlsgrab";

spdlog::level::level_enum to_level(Verbosity verbosity) noexcept {
    switch (verbosity) {
        case Verbosity::quiet:   return spdlog::level::warn;
        case Verbosity::verbose: return spdlog::level::debug;
        case Verbosity::normal:
        default:                 return spdlog::level::info;
    }
}

} // namespace

void init_logging(Verbosity verbosity) noexcept {
    try {
        auto logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stderr_color_mt(LOGGER_NAME);
            logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
            spdlog::set_default_logger(logger);
        }
        logger->set_level(to_level(verbosity));
    } catch (const spdlog::spdlog_ex&) {
        // Keep whatever default logger spdlog already has
        spdlog::set_level(to_level(verbosity));
    }
}

} // namespace hlsgrab::core
