// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/core/error.hpp>
#include <hlsgrab/disk/error.hpp>
#include <hlsgrab/media/error.hpp>

using namespace hlsgrab;

TEST_CASE("status_to_error", "[error]") {
    CHECK_FALSE(core::status_to_error(200));
    CHECK_FALSE(core::status_to_error(206));
    CHECK(core::status_to_error(404) == core::TransportErrc::not_found);
    CHECK(core::status_to_error(403) == core::TransportErrc::permission_denied);
    CHECK(core::status_to_error(401) == core::TransportErrc::permission_denied);
    CHECK(core::status_to_error(410) == core::TransportErrc::client_error);
    CHECK(core::status_to_error(503) == core::TransportErrc::server_error);
    CHECK(core::status_to_error(304) == core::TransportErrc::network_error);
}

TEST_CASE("Error categories", "[error]") {
    std::error_code media_ec = media::MediaErrc::no_eligible_variant;
    std::error_code transport_ec = core::TransportErrc::timeout;
    std::error_code disk_ec = disk::DiskErrc::disk_full;

    CHECK(std::string(media_ec.category().name()) == "hlsgrab::media");
    CHECK(std::string(transport_ec.category().name()) == "hlsgrab::transport");
    CHECK(std::string(disk_ec.category().name()) == "hlsgrab::disk");
    CHECK(media_ec != transport_ec);
    CHECK(media_ec.message() == "Master playlist has no eligible variant");
}

TEST_CASE("MediaError::message", "[error]") {
    media::MediaError error{
        make_error_code(media::MediaErrc::playlist_fetch_error), 2,
        "https://cdn.example.com/hi.m3u8", make_error_code(core::TransportErrc::not_found)};
    auto text = error.message();
    CHECK_THAT(text, Catch::Matchers::StartsWith("Could not fetch playlist (hop 2): https://cdn.example.com/hi.m3u8"));
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring("["));

    media::MediaError bare{make_error_code(media::MediaErrc::cancelled), 0, {}, {}};
    CHECK(bare.message() == "Cancelled");
}
