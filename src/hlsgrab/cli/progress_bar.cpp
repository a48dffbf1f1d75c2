// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace hlsgrab::cli {

ProgressBar::ProgressBar(std::uint32_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(bar_width - filled), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::render(std::uint32_t completed, std::uint32_t failed) const {
    double percent = total_ == 0
        ? 100.0
        : static_cast<double>(completed) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);

    // Right-align the percentage
    auto pct = std::to_string(static_cast<int>(percent));
    line += ' ';
    line.append(3 - std::min<std::size_t>(pct.size(), 3), ' ');
    line += pct + "%";

    line += " (" + std::to_string(completed) + "/" + std::to_string(total_);
    if (failed > 0) {
        line += ", " + std::to_string(failed) + " failed";
    }
    line += ")";
    return line;
}

void ProgressBar::update(std::uint32_t completed, std::uint32_t failed) noexcept {
    if (finished_) return;
    completed_ = completed;
    failed_ = failed;

    std::cout << "\r" << render(completed, failed) << std::string(4, ' ') << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    update(completed_, failed_);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(70, ' ') << "\r" << std::flush;
}

} // namespace hlsgrab::cli
