// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace hlsgrab::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t PROBE_TIMEOUT_SEC = 5;          // HEAD / existence checks
constexpr std::uint32_t TRANSFER_TIMEOUT_SEC = 30;      // Full body transfers
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::size_t WRITE_BUFFER_SIZE = 64 * 1024;    // 64 KB

constexpr std::uint32_t MAX_PLAYLIST_HOPS = 5;
constexpr std::uint32_t DEFAULT_CONCURRENCY = 4;
constexpr std::uint32_t MAX_CONCURRENCY = 32;

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
constexpr std::string_view DEFAULT_REMUX_TOOL = "ffmpeg";
constexpr std::string_view DEFAULT_OUTPUT_DIR = "downloads";

constexpr std::string_view SEGMENT_FILE_PREFIX = "segment_";
constexpr std::string_view SEGMENT_FILE_EXTENSION = ".ts";
constexpr int SEGMENT_NAME_WIDTH = 5;                    // segment_00001.ts
constexpr std::string_view CONCAT_MANIFEST_NAME = "concat_list.txt";
constexpr std::string_view SCRATCH_DIR_PREFIX = "hlsgrab_";

} // namespace hlsgrab::core
