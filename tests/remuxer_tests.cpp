// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/media/remuxer.hpp>
#include "fakes.hpp"

using namespace hlsgrab::media;
using hlsgrab::test::TempDir;

TEST_CASE("FfmpegRemuxer::build_arguments", "[remuxer]") {
    auto args = FfmpegRemuxer::build_arguments("ffmpeg", "/tmp/x/concat_list.txt", "out/talk.mp4");
    std::vector<std::string> expected{
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-f", "concat", "-safe", "0",
        "-i", "/tmp/x/concat_list.txt",
        "-c", "copy",
        "-y", "out/talk.mp4",
    };
    CHECK(args == expected);
}

TEST_CASE("FfmpegRemuxer::concat - tool problems", "[remuxer]") {
    TempDir tmp;
    auto manifest = tmp.path() / "concat_list.txt";
    std::ofstream(manifest) << "file '/nonexistent/segment_00001.ts'\n";

    SECTION("Missing tool") {
        FfmpegRemuxer remuxer("hlsgrab-no-such-remux-tool");
        CHECK(remuxer.concat(manifest, tmp.path() / "out.mp4") == MediaErrc::remux_unavailable);
    }

    SECTION("Tool exits non-zero") {
        FfmpegRemuxer remuxer("false");
        CHECK(remuxer.concat(manifest, tmp.path() / "out.mp4") == MediaErrc::remux_failed);
        CHECK(std::filesystem::exists(tmp.path() / "remux.log"));
    }
}

TEST_CASE("FfmpegRemuxer - default tool", "[remuxer]") {
    FfmpegRemuxer remuxer;
    CHECK(remuxer.tool() == "ffmpeg");
}
