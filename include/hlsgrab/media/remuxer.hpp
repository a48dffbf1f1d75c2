// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/config.hpp>
#include <hlsgrab/media/error.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace hlsgrab::media {

// Joins the files listed in a concat manifest into one container
// without re-encoding.
class Remuxer {
public:
    virtual ~Remuxer() = default;

    // remux_unavailable if the tool cannot be started, remux_failed if it
    // ran and reported an error
    [[nodiscard]] virtual std::error_code
    concat(const std::filesystem::path& manifest,
           const std::filesystem::path& output) noexcept = 0;
};

// Runs an external ffmpeg-compatible binary (looked up in PATH)
class FfmpegRemuxer final : public Remuxer {
public:
    explicit FfmpegRemuxer(std::string tool = std::string(core::DEFAULT_REMUX_TOOL));

    [[nodiscard]] std::error_code
    concat(const std::filesystem::path& manifest,
           const std::filesystem::path& output) noexcept override;

    [[nodiscard]] const std::string& tool() const noexcept { return tool_; }

    // argv for a stream-copy concat, tool name first
    [[nodiscard]] static std::vector<std::string>
    build_arguments(const std::string& tool,
                    const std::filesystem::path& manifest,
                    const std::filesystem::path& output);

private:
    std::string tool_;
};

} // namespace hlsgrab::media
