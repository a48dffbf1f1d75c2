// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/media/segment_fetcher.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>

using namespace hlsgrab;
using namespace hlsgrab::media;
using hlsgrab::test::FakeTransport;
using hlsgrab::test::TempDir;
using hlsgrab::test::read_file;

namespace {

const std::string BASE = "https://cdn.example.com/v/";

ResolvedPlaylist make_playlist(FakeTransport& transport, std::uint32_t count) {
    std::vector<Segment> segments;
    for (std::uint32_t i = 1; i <= count; ++i) {
        auto url = BASE + "seg" + std::to_string(i) + ".ts";
        transport.add(url, "data" + std::to_string(i) + ";");
        segments.push_back(Segment{url, i});
    }
    return ResolvedPlaylist(BASE + "index.m3u8", BASE + "index.m3u8",
                            std::move(segments), 1, std::nullopt, {});
}

} // namespace

TEST_CASE("SegmentFetcher::segment_file_name", "[fetcher]") {
    CHECK(SegmentFetcher::segment_file_name(1) == "segment_00001.ts");
    CHECK(SegmentFetcher::segment_file_name(12345) == "segment_12345.ts");
    CHECK(SegmentFetcher::segment_file_name(123456) == "segment_123456.ts");
}

TEST_CASE("SegmentFetcher::fetch - all segments", "[fetcher]") {
    TempDir tmp;
    FakeTransport transport;
    auto playlist = make_playlist(transport, 12);

    auto concurrency = GENERATE(1u, 4u);
    SegmentFetcher fetcher(transport, FetchConfig{concurrency, tmp.path()});

    std::mutex events_mutex;
    std::vector<FetchProgress> events;
    auto batch = fetcher.fetch(playlist, {}, [&](const FetchProgress& p) {
        std::lock_guard lock(events_mutex);
        events.push_back(p);
    });
    REQUIRE(batch.has_value());

    CHECK(batch->total() == 12);
    CHECK(batch->succeeded() == 12);
    CHECK(batch->failed() == 0);
    CHECK_FALSE(batch->cancelled());

    SECTION("Slots keep playlist order") {
        const auto& results = batch->results();
        for (std::uint32_t i = 0; i < results.size(); ++i) {
            CHECK(results[i].segment.ordinal == i + 1);
            CHECK(results[i].local_path.filename() == SegmentFetcher::segment_file_name(i + 1));
            CHECK(read_file(results[i].local_path) == "data" + std::to_string(i + 1) + ";");
        }
    }

    SECTION("One progress event per segment, completed counts up") {
        REQUIRE(events.size() == 12);
        std::sort(events.begin(), events.end(),
                  [](const FetchProgress& a, const FetchProgress& b) { return a.completed < b.completed; });
        std::set<std::uint32_t> ordinals;
        for (std::uint32_t i = 0; i < events.size(); ++i) {
            CHECK(events[i].completed == i + 1);
            CHECK(events[i].total == 12);
            CHECK(events[i].success);
            ordinals.insert(events[i].ordinal);
        }
        CHECK(ordinals.size() == 12);
    }

    SECTION("Every segment is requested exactly once") {
        for (std::uint32_t i = 1; i <= 12; ++i) {
            CHECK(transport.request_count(BASE + "seg" + std::to_string(i) + ".ts") == 1);
        }
    }
}

TEST_CASE("SegmentFetcher::fetch - callbacks do not block other workers", "[fetcher]") {
    TempDir tmp;
    FakeTransport transport;
    auto playlist = make_playlist(transport, 8);
    SegmentFetcher fetcher(transport, FetchConfig{4, tmp.path()});

    // Each callback waits for a second one to be running at the same time
    std::mutex mutex;
    std::condition_variable cv;
    std::uint32_t inside = 0;
    std::uint32_t peak = 0;

    auto batch = fetcher.fetch(playlist, {}, [&](const FetchProgress&) {
        std::unique_lock lock(mutex);
        ++inside;
        peak = std::max(peak, inside);
        cv.notify_all();
        cv.wait_for(lock, std::chrono::seconds(2), [&] { return peak >= 2; });
        --inside;
    });
    REQUIRE(batch.has_value());

    CHECK(batch->succeeded() == 8);
    CHECK(peak >= 2);
}

TEST_CASE("SegmentFetcher::fetch - failed slot", "[fetcher]") {
    TempDir tmp;
    FakeTransport transport;
    auto playlist = make_playlist(transport, 5);
    transport.fail(BASE + "seg3.ts", make_error_code(core::TransportErrc::not_found));

    SegmentFetcher fetcher(transport, FetchConfig{3, tmp.path()});
    auto batch = fetcher.fetch(playlist);
    REQUIRE(batch.has_value());

    CHECK(batch->succeeded() == 4);
    CHECK(batch->failed() == 1);
    CHECK_FALSE(batch->cancelled());

    const auto& slot = batch->results()[2];
    CHECK(slot.segment.ordinal == 3);
    CHECK_FALSE(slot.success);
    CHECK(slot.error == core::TransportErrc::not_found);
    CHECK_FALSE(std::filesystem::exists(slot.local_path));

    CHECK(batch->results()[3].success);
    CHECK(batch->results()[3].segment.ordinal == 4);
}

TEST_CASE("SegmentFetcher::fetch - scratch directory lifetime", "[fetcher]") {
    TempDir tmp;
    FakeTransport transport;
    auto playlist = make_playlist(transport, 3);
    SegmentFetcher fetcher(transport, FetchConfig{2, tmp.path()});

    std::filesystem::path directory;
    {
        auto batch = fetcher.fetch(playlist);
        REQUIRE(batch.has_value());
        directory = batch->directory();
        CHECK(std::filesystem::is_directory(directory));
        CHECK(directory.parent_path() == tmp.path());
        CHECK(directory.filename().string().starts_with("hlsgrab_"));
    }
    CHECK_FALSE(std::filesystem::exists(directory));
}

TEST_CASE("SegmentFetcher::fetch - cancellation", "[fetcher]") {
    TempDir tmp;
    FakeTransport transport;
    auto playlist = make_playlist(transport, 10);

    std::stop_source stop;
    transport.on_download([&](const std::string& url) {
        if (url == BASE + "seg2.ts") {
            stop.request_stop();
        }
    });

    SegmentFetcher fetcher(transport, FetchConfig{1, tmp.path()});
    auto batch = fetcher.fetch(playlist, stop.get_token());
    REQUIRE(batch.has_value());

    CHECK(batch->cancelled());
    CHECK(batch->succeeded() == 2);
    for (std::size_t i = 2; i < batch->results().size(); ++i) {
        CHECK(batch->results()[i].error == MediaErrc::cancelled);
        CHECK_FALSE(batch->results()[i].success);
    }
    CHECK(transport.requests().size() == 2);
}

TEST_CASE("SegmentFetcher::fetch - empty playlist", "[fetcher]") {
    FakeTransport transport;
    ResolvedPlaylist empty("https://x/index.m3u8", "https://x/index.m3u8", {}, 1, std::nullopt, {});
    SegmentFetcher fetcher(transport);
    auto batch = fetcher.fetch(empty);
    REQUIRE(!batch.has_value());
    CHECK(batch.error() == MediaErrc::fetch_aborted);
    CHECK(transport.requests().empty());
}
