// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/media/media_downloader.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <atomic>

using namespace hlsgrab;
using namespace hlsgrab::media;
using hlsgrab::test::FakeRemuxer;
using hlsgrab::test::FakeTransport;
using hlsgrab::test::TempDir;
using hlsgrab::test::read_file;

namespace {

const std::string BASE = "https://cdn.example.com/course/";

// master.m3u8 -> hi/index.m3u8 with `count` segments
void serve_stream(FakeTransport& transport, std::uint32_t count) {
    transport.add(BASE + "master.m3u8",
        "#EXTM3U\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=400000,RESOLUTION=640x360\n"
        "lo/index.m3u8\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=2500000,RESOLUTION=1280x720\n"
        "hi/index.m3u8\n");

    std::string media = "#EXTM3U\n#EXT-X-TARGETDURATION:6\n";
    for (std::uint32_t i = 1; i <= count; ++i) {
        media += "#EXTINF:6.0,\nseg-" + std::to_string(i) + "-v1.ts\n";
        transport.add(BASE + "hi/seg-" + std::to_string(i) + "-v1.ts", "<" + std::to_string(i) + ">");
    }
    media += "#EXT-X-ENDLIST\n";
    transport.add(BASE + "hi/index.m3u8", media);
}

DownloadOptions options_in(const TempDir& tmp) {
    DownloadOptions options;
    options.fetch.scratch_parent = tmp.path();
    return options;
}

} // namespace

TEST_CASE("MediaDownloader::run - full success", "[downloader]") {
    TempDir tmp;
    FakeTransport transport;
    FakeRemuxer remuxer;
    serve_stream(transport, 6);

    MediaDownloader downloader(transport, remuxer, options_in(tmp));
    std::atomic<std::uint32_t> events{0};
    downloader.callback([&](const FetchProgress&) { ++events; });

    auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "course.mp4");
    REQUIRE(report.has_value());

    CHECK(report->muxed);
    CHECK(report->output == tmp.path() / "course.mp4");
    CHECK(report->total_segments == 6);
    CHECK(report->failed_segments == 0);
    CHECK(report->used_segments == 6);
    CHECK(report->hops == 2);
    REQUIRE(report->variant.has_value());
    CHECK(report->variant->bandwidth == 2500000);
    CHECK_FALSE(report->degraded());
    CHECK(report->summary() == "success");
    CHECK(events.load() == 6);
}

TEST_CASE("MediaDownloader::run - degraded success", "[downloader]") {
    TempDir tmp;
    FakeTransport transport;
    FakeRemuxer remuxer;
    serve_stream(transport, 10);
    transport.fail(BASE + "hi/seg-5-v1.ts", make_error_code(core::TransportErrc::timeout));

    MediaDownloader downloader(transport, remuxer, options_in(tmp));
    auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "course.mp4");
    REQUIRE(report.has_value());

    CHECK(report->degraded());
    CHECK(report->failed_segments == 1);
    CHECK(report->used_segments == 9);
    CHECK(report->summary() == "degraded success, 1/10 segments missing");

    auto manifest = remuxer.manifest_text;
    CHECK(std::count(manifest.begin(), manifest.end(), '\n') == 9);
    CHECK(manifest.find("segment_00005.ts") == std::string::npos);
    CHECK(manifest.find("segment_00004.ts") < manifest.find("segment_00006.ts"));
}

TEST_CASE("MediaDownloader::run - remux fallback", "[downloader]") {
    TempDir tmp;
    FakeTransport transport;
    FakeRemuxer remuxer(make_error_code(MediaErrc::remux_unavailable));
    serve_stream(transport, 3);

    MediaDownloader downloader(transport, remuxer, options_in(tmp));
    auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "course.mp4");
    REQUIRE(report.has_value());

    CHECK_FALSE(report->muxed);
    CHECK(report->output == tmp.path() / "course.ts");
    CHECK(read_file(report->output) == "<1><2><3>");
}

TEST_CASE("MediaDownloader::run - failures", "[downloader]") {
    TempDir tmp;
    FakeTransport transport;
    FakeRemuxer remuxer;

    SECTION("Resolution errors carry hop and location") {
        transport.add(BASE + "master.m3u8", "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\nmissing.m3u8\n");
        MediaDownloader downloader(transport, remuxer, options_in(tmp));
        auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "x.mp4");
        REQUIRE(!report.has_value());
        CHECK(report.error().code == MediaErrc::playlist_fetch_error);
        CHECK(report.error().hop == 2);
        CHECK(report.error().location == BASE + "missing.m3u8");
    }

    SECTION("Every segment failing is an assembly failure") {
        serve_stream(transport, 2);
        transport.fail(BASE + "hi/seg-1-v1.ts", make_error_code(core::TransportErrc::server_error));
        transport.fail(BASE + "hi/seg-2-v1.ts", make_error_code(core::TransportErrc::server_error));

        MediaDownloader downloader(transport, remuxer, options_in(tmp));
        auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "x.mp4");
        REQUIRE(!report.has_value());
        CHECK(report.error().code == MediaErrc::assembly_failure);
        CHECK(report.error().cause == core::TransportErrc::server_error);
        CHECK(remuxer.calls == 0);
    }

    SECTION("Cancelled before start") {
        serve_stream(transport, 2);
        MediaDownloader downloader(transport, remuxer, options_in(tmp));
        downloader.cancel();
        auto report = downloader.run(BASE + "master.m3u8", tmp.path() / "x.mp4");
        REQUIRE(!report.has_value());
        CHECK(report.error().code == MediaErrc::cancelled);
        CHECK(transport.request_count(BASE + "hi/seg-1-v1.ts") == 0);
    }
}

TEST_CASE("MediaDownloader::resolve", "[downloader]") {
    FakeTransport transport;
    FakeRemuxer remuxer;
    serve_stream(transport, 4);

    MediaDownloader downloader(transport, remuxer);
    auto playlist = downloader.resolve(BASE + "master.m3u8");
    REQUIRE(playlist.has_value());
    CHECK(playlist->size() == 4);
    CHECK(playlist->segments().front().location == BASE + "hi/seg-1-v1.ts");
    CHECK(remuxer.calls == 0);
}

TEST_CASE("default_output_name", "[downloader]") {
    CHECK(default_output_name("https://mediaspace.example.edu/media/Lecture+One/1_abc") == "1_abc.mp4");
    CHECK(default_output_name("https://mediaspace.example.edu/media/Lecture+One") == "Lecture_One.mp4");
    CHECK(default_output_name("https://example.com/videos/my talk/") == "my_talk.mp4");
    CHECK(default_output_name("https://example.com/watch?v=1") == "watch.mp4");
    CHECK(default_output_name("https://example.com") == "video.mp4");
    CHECK(default_output_name("https://example.com/") == "video.mp4");
    CHECK(default_output_name("https://cdn.example.com/videos/talk.mp4") == "talk.mp4");
    CHECK(default_output_name("https://cdn.example.com/videos/talk.mp4?token=1") == "talk.mp4");
}
