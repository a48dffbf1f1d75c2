// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <cstdint>

namespace hlsgrab::core {

enum class Verbosity : std::uint8_t {
    quiet,    // Warnings and errors only
    normal,
    verbose   // Debug output (per-hop and per-segment detail)
};

// Install the "hlsgrab" stderr logger as the spdlog default logger.
// Safe to call more than once; later calls only change the level.
void init_logging(Verbosity verbosity) noexcept;

} // namespace hlsgrab::core
