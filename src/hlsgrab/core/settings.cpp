// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/core/settings.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace hlsgrab::core {

namespace {

using nlohmann::json;

// Copy j[key] into out if present; wrong types throw json::type_error.
// Unsigned fields accept only non-negative integers that fit.
template<typename T>
[[nodiscard]] bool read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_unsigned()
            || it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return false;
        }
    }
    out = it->get<T>();
    return true;
}

} // namespace

std::expected<Settings, std::error_code>
Settings::parse(std::string_view json_text) noexcept {
    Settings settings;

    json j;
    try {
        j = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error&) {
        return std::unexpected(make_error_code(ConfigErrc::parse_error));
    }

    if (!j.is_object()) {
        return std::unexpected(make_error_code(ConfigErrc::invalid_value));
    }

    try {
        auto& transport = settings.transport;
        bool valid = read_key(j, "user_agent", transport.user_agent)
            && read_key(j, "connect_timeout_sec", transport.connect_timeout_sec)
            && read_key(j, "probe_timeout_sec", transport.probe_timeout_sec)
            && read_key(j, "transfer_timeout_sec", transport.transfer_timeout_sec)
            && read_key(j, "max_redirects", transport.max_redirects)
            && read_key(j, "verify_tls", transport.verify_tls);

        if (auto it = j.find("headers"); valid && it != j.end()) {
            if (!it->is_object()) {
                return std::unexpected(make_error_code(ConfigErrc::invalid_value));
            }
            for (auto& [key, value] : it->items()) {
                transport.headers.emplace_back(key, value.get<std::string>());
            }
        }

        valid = valid
            && read_key(j, "max_hops", settings.max_hops)
            && read_key(j, "concurrency", settings.concurrency)
            && read_key(j, "remux_tool", settings.remux_tool)
            && read_key(j, "output_dir", settings.output_dir);
        if (!valid) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_value));
        }
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(ConfigErrc::invalid_value));
    }

    if (settings.max_hops == 0) {
        return std::unexpected(make_error_code(ConfigErrc::invalid_value));
    }
    settings.concurrency = std::clamp(settings.concurrency, 1u, MAX_CONCURRENCY);

    return settings;
}

std::expected<Settings, std::error_code>
Settings::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(ConfigErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ConfigErrc::file_not_found));
    }
}

std::filesystem::path Settings::default_path() noexcept {
    try {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return std::filesystem::path(xdg) / "hlsgrab" / "config.json";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::filesystem::path(home) / ".config" / "hlsgrab" / "config.json";
        }
    } catch (const std::exception&) {
        return {};
    }
    return {};
}

} // namespace hlsgrab::core
