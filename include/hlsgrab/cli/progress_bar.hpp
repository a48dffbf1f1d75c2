// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace hlsgrab::cli {

// Segment-count progress bar for the CLI
class ProgressBar {
public:
    ProgressBar(std::uint32_t total, std::string_view label = {});

    // Update progress
    void update(std::uint32_t completed, std::uint32_t failed = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint32_t total() const noexcept { return total_; }
    void total(std::uint32_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    // "[=====>     ]  45% (9/20, 1 failed)"
    [[nodiscard]] std::string render(std::uint32_t completed, std::uint32_t failed) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint32_t total_{0};
    std::uint32_t completed_{0};
    std::uint32_t failed_{0};
    std::string label_;
    bool finished_{false};
};

} // namespace hlsgrab::cli
