// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace hlsgrab::core {

enum class TransportErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    client_error,
    server_error,
    permission_denied,
    invalid_url,
    too_many_redirects,
    ssl_error,
    dns_error,
    write_failed,
    cancelled,
};

// Configuration file errors
enum class ConfigErrc {
    success = 0,
    file_not_found,
    parse_error,
    invalid_value,
};

namespace detail {

struct TransportErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hlsgrab::transport";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransportErrc>(ev)) {
            case TransportErrc::success:             return "Success";
            case TransportErrc::network_error:       return "Network error";
            case TransportErrc::timeout:             return "Operation timed out";
            case TransportErrc::refused:             return "Connection refused";
            case TransportErrc::not_found:           return "Resource not found (404)";
            case TransportErrc::client_error:        return "Client error (4xx)";
            case TransportErrc::server_error:        return "Server error (5xx)";
            case TransportErrc::permission_denied:   return "Permission denied (401/403)";
            case TransportErrc::invalid_url:         return "Invalid URL";
            case TransportErrc::too_many_redirects:  return "Too many redirects";
            case TransportErrc::ssl_error:           return "SSL/TLS error";
            case TransportErrc::dns_error:           return "DNS resolution failed";
            case TransportErrc::write_failed:        return "Failed to write response body";
            case TransportErrc::cancelled:           return "Transfer cancelled";
            default:                                 return "Unknown error";
        }
    }
};

struct ConfigErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hlsgrab::config";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ConfigErrc>(ev)) {
            case ConfigErrc::success:         return "Success";
            case ConfigErrc::file_not_found:  return "Configuration file not found";
            case ConfigErrc::parse_error:     return "Configuration file is not valid JSON";
            case ConfigErrc::invalid_value:   return "Configuration value has the wrong type";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransportErrcCategory& transport_errc_category() noexcept {
    static detail::TransportErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransportErrc e) noexcept {
    return {static_cast<int>(e), transport_errc_category()};
}

inline const detail::ConfigErrcCategory& config_errc_category() noexcept {
    static detail::ConfigErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ConfigErrc e) noexcept {
    return {static_cast<int>(e), config_errc_category()};
}

// Map an HTTP status to a transport error (empty for 2xx)
[[nodiscard]] inline std::error_code status_to_error(long http_code) noexcept {
    if (http_code >= 200 && http_code < 300) return {};
    if (http_code == 404) return make_error_code(TransportErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(TransportErrc::permission_denied);
    if (http_code >= 500) return make_error_code(TransportErrc::server_error);
    if (http_code >= 400) return make_error_code(TransportErrc::client_error);
    return make_error_code(TransportErrc::network_error);
}

} // namespace hlsgrab::core

namespace std {

template<>
struct is_error_code_enum<hlsgrab::core::TransportErrc> : true_type {};

template<>
struct is_error_code_enum<hlsgrab::core::ConfigErrc> : true_type {};

} // namespace std
