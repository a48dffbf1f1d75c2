// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsgrab/core/config.hpp>
#include <hlsgrab/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hlsgrab::core {

// HTTP response (body is only filled by Transport::get)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-cased names
    std::uint64_t content_length{0};
    std::string content_type;
    std::string effective_url;
    std::string body;
};

// Transport settings, passed by value into each session
struct TransportConfig {
    std::string user_agent{DEFAULT_USER_AGENT};
    std::vector<std::pair<std::string, std::string>> headers;
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t probe_timeout_sec{PROBE_TIMEOUT_SEC};
    std::uint32_t transfer_timeout_sec{TRANSFER_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool verify_tls{true};
};

// Byte-fetch capability used by the resolver and fetcher.
// Any non-2xx status is reported as an error. Implementations must allow
// concurrent calls from several worker threads.
class Transport {
public:
    virtual ~Transport() = default;

    // Fetch the whole body into memory
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url) noexcept = 0;

    // Stream the body into a file (truncated first)
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    download(const std::string& url, const std::filesystem::path& path) noexcept = 0;

    // Quick existence probe (short timeout, no body)
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;
};

} // namespace hlsgrab::core
