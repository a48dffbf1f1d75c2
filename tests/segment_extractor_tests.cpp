// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/media/segment_extractor.hpp>

using namespace hlsgrab::media;

namespace {

PlaylistDocument parse_ok(std::string_view text) {
    auto doc = PlaylistParser::parse(text);
    REQUIRE(doc.has_value());
    return *doc;
}

} // namespace

TEST_CASE("SegmentExtractor::extract - order and ordinals", "[segment]") {
    SegmentExtractor extractor;

    SECTION("Non-segment lines between segments are skipped") {
        auto doc = parse_ok("seg_001.ts\n#EXT-X-DISCONTINUITY\nseg_002.ts\n");
        auto segments = extractor.extract(doc, "https://host/path/index.m3u8");
        REQUIRE(segments.size() == 2);
        CHECK(segments[0] == Segment{"https://host/path/seg_001.ts", 1});
        CHECK(segments[1] == Segment{"https://host/path/seg_002.ts", 2});
    }

    SECTION("Relative path with a subdirectory") {
        auto doc = parse_ok("#EXTM3U\n#EXTINF:6,\nchunk/001.ts\n");
        auto segments = extractor.extract(doc, "https://host/path/index.m3u8");
        REQUIRE(segments.size() == 1);
        CHECK(segments[0].location == "https://host/path/chunk/001.ts");
    }

    SECTION("N qualifying lines give N segments in line order") {
        std::string text = "#EXTM3U\n#EXT-X-TARGETDURATION:10\n";
        for (int i = 1; i <= 25; ++i) {
            text += "#EXTINF:10.0,\n";
            text += "part" + std::to_string(i) + ".ts\n";
            if (i % 7 == 0) {
                text += "#EXT-X-DISCONTINUITY\nnotes.txt\n";
            }
        }
        text += "#EXT-X-ENDLIST\n";

        auto segments = extractor.extract(parse_ok(text), "https://host/v/index.m3u8");
        REQUIRE(segments.size() == 25);
        for (std::uint32_t i = 0; i < segments.size(); ++i) {
            CHECK(segments[i].ordinal == i + 1);
            CHECK(segments[i].location == "https://host/v/part" + std::to_string(i + 1) + ".ts");
        }
    }

    SECTION("No qualifying lines") {
        auto doc = parse_ok("#EXTM3U\n#EXT-X-ENDLIST\nreadme.txt\n");
        CHECK(extractor.extract(doc, "https://host/index.m3u8").empty());
    }
}

TEST_CASE("looks_like_segment", "[segment]") {
    CHECK(looks_like_segment("seg1.ts"));
    CHECK(looks_like_segment("SEG1.TS"));
    CHECK(looks_like_segment("media_0.ts?token=abc"));
    CHECK(looks_like_segment("https://host/segment42"));
    CHECK(looks_like_segment("/chunk/7"));
    CHECK(looks_like_segment("https://host/seg-12-v1-a1"));
    CHECK(looks_like_segment("video_seg_12.m4s"));
    CHECK(looks_like_segment("chunk_3"));

    CHECK_FALSE(looks_like_segment("index.m3u8"));
    CHECK_FALSE(looks_like_segment("init.mp4"));
    CHECK_FALSE(looks_like_segment("notes.txt"));
    CHECK_FALSE(looks_like_segment("segfault.html"));
}

TEST_CASE("SegmentExtractor - custom filter", "[segment]") {
    SegmentExtractor mp4_only([](std::string_view uri) { return uri.ends_with(".m4s"); });
    auto doc = parse_ok("#EXTM3U\na.m4s\nb.ts\nc.m4s\n");
    auto segments = mp4_only.extract(doc, "https://host/x/index.m3u8");
    REQUIRE(segments.size() == 2);
    CHECK(segments[0] == Segment{"https://host/x/a.m4s", 1});
    CHECK(segments[1] == Segment{"https://host/x/c.m4s", 2});

    SECTION("An empty filter falls back to the heuristic") {
        SegmentExtractor fallback{SegmentFilter{}};
        CHECK(fallback.extract(doc, "https://host/x/index.m3u8").size() == 1);
    }
}
