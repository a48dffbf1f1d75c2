// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/transport.hpp>
#include <string>
#include <string_view>

namespace hlsgrab::core {

// libcurl transport. Every request uses its own easy handle, so one session
// can be shared by all fetch workers.
class HttpSession final : public Transport {
public:
    HttpSession() = default;
    explicit HttpSession(TransportConfig config);

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    download(const std::string& url, const std::filesystem::path& path) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] const TransportConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup, before any worker starts)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    TransportConfig config_;
};

} // namespace hlsgrab::core
