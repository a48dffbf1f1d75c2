// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/media/playlist.hpp>

using namespace hlsgrab::media;

TEST_CASE("PlaylistParser::parse - line classification", "[playlist]") {
    const std::string text =
        "#EXTM3U\r\n"
        "#EXT-X-VERSION:3\r\n"
        "\r\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=1280000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1280x720\n"
        "   720p/index.m3u8   \n"
        "#EXT-X-FOO:bar\n";

    auto doc = PlaylistParser::parse(text);
    REQUIRE(doc.has_value());
    REQUIRE(doc->size() == 5);

    SECTION("Directives and URIs") {
        CHECK((*doc)[0].is_directive());
        CHECK((*doc)[0].tag == "EXTM3U");
        CHECK((*doc)[1].tag == "EXT-X-VERSION");
        CHECK((*doc)[1].raw_attributes == "3");
        CHECK((*doc)[3].is_uri());
        CHECK((*doc)[3].uri == "720p/index.m3u8");
    }

    SECTION("Quoted attribute values keep their commas") {
        const auto& inf = (*doc)[2];
        CHECK(inf.tag == TAG_STREAM_INF);
        CHECK(inf.attribute("BANDWIDTH") == "1280000");
        CHECK(inf.attribute("CODECS") == "avc1.4d401f,mp4a.40.2");
        CHECK(inf.attribute("RESOLUTION") == "1280x720");
        CHECK(inf.attribute("MISSING").empty());
    }

    SECTION("Unknown tags pass through") {
        CHECK((*doc)[4].tag == "EXT-X-FOO");
        CHECK((*doc)[4].raw_attributes == "bar");
    }
}

TEST_CASE("PlaylistParser::parse - malformed input", "[playlist]") {
    SECTION("Empty") {
        auto doc = PlaylistParser::parse("");
        REQUIRE(!doc.has_value());
        CHECK(doc.error() == MediaErrc::malformed_playlist);
    }

    SECTION("Whitespace only") {
        auto doc = PlaylistParser::parse(" \r\n\t\n  \n");
        REQUIRE(!doc.has_value());
        CHECK(doc.error() == MediaErrc::malformed_playlist);
    }

    SECTION("No header is still accepted") {
        auto doc = PlaylistParser::parse("seg1.ts\nseg2.ts\n");
        REQUIRE(doc.has_value());
        CHECK(doc->size() == 2);
    }
}

TEST_CASE("PlaylistParser::parse - deterministic", "[playlist]") {
    const std::string text = "#EXTM3U\n#EXTINF:10.0,\nseg1.ts\n#EXTINF:10.0,\nseg2.ts\n";
    auto first = PlaylistParser::parse(text);
    auto second = PlaylistParser::parse(text);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
}

TEST_CASE("PlaylistParser::parse_attributes", "[playlist]") {
    auto attrs = PlaylistParser::parse_attributes(
        R"(TYPE=SUBTITLES,GROUP-ID="subs",NAME="English, US",FLAG,DEFAULT=NO)");
    CHECK(attrs.size() == 4);
    CHECK(attrs["TYPE"] == "SUBTITLES");
    CHECK(attrs["GROUP-ID"] == "subs");
    CHECK(attrs["NAME"] == "English, US");
    CHECK(attrs["DEFAULT"] == "NO");
    CHECK(attrs.find("FLAG") == attrs.end());
}

TEST_CASE("is_master_playlist", "[playlist]") {
    auto master = PlaylistParser::parse("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\nlow.m3u8\n");
    auto media = PlaylistParser::parse("#EXTM3U\n#EXTINF:4,\nseg1.ts\n");
    REQUIRE(master.has_value());
    REQUIRE(media.has_value());
    CHECK(is_master_playlist(*master));
    CHECK_FALSE(is_master_playlist(*media));
}
