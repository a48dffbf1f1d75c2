// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace hlsgrab::media {

enum class MediaErrc {
    success = 0,
    malformed_playlist,
    no_eligible_variant,
    no_segments_found,
    playlist_loop_detected,
    playlist_fetch_error,
    segment_fetch_error,
    fetch_aborted,
    assembly_failure,
    remux_unavailable,
    remux_failed,
    cancelled,
};

namespace detail {

struct MediaErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hlsgrab::media";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<MediaErrc>(ev)) {
            case MediaErrc::success:                 return "Success";
            case MediaErrc::malformed_playlist:      return "Malformed or empty playlist";
            case MediaErrc::no_eligible_variant:     return "Master playlist has no eligible variant";
            case MediaErrc::no_segments_found:       return "No segments found in playlist";
            case MediaErrc::playlist_loop_detected:  return "Too many playlist redirections";
            case MediaErrc::playlist_fetch_error:    return "Could not fetch playlist";
            case MediaErrc::segment_fetch_error:     return "Could not fetch segment";
            case MediaErrc::fetch_aborted:           return "Nothing to fetch";
            case MediaErrc::assembly_failure:        return "No segment data to assemble";
            case MediaErrc::remux_unavailable:       return "Remux tool not available";
            case MediaErrc::remux_failed:            return "Remux tool failed";
            case MediaErrc::cancelled:               return "Cancelled";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::MediaErrcCategory& media_errc_category() noexcept {
    static detail::MediaErrcCategory category;
    return category;
}

inline std::error_code make_error_code(MediaErrc e) noexcept {
    return {static_cast<int>(e), media_errc_category()};
}

// Pipeline failure with enough context to retry by hand
struct MediaError {
    std::error_code code;
    std::uint32_t hop{0};        // Playlist hop (1-based), 0 outside resolution
    std::string location;        // Playlist URL or output path involved
    std::error_code cause;       // Underlying transport/disk error, if any

    [[nodiscard]] std::string message() const {
        std::string msg = code.message();
        if (hop > 0) {
            msg += " (hop " + std::to_string(hop) + ")";
        }
        if (!location.empty()) {
            msg += ": " + location;
        }
        if (cause) {
            msg += " [" + cause.message() + "]";
        }
        return msg;
    }
};

} // namespace hlsgrab::media

namespace std {

template<>
struct is_error_code_enum<hlsgrab::media::MediaErrc> : true_type {};

} // namespace std
