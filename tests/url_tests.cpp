// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsgrab/core/url.hpp>

using namespace hlsgrab::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://cdn.example.com/hls/master.m3u8");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "cdn.example.com");
        CHECK(url.path() == "/hls/master.m3u8");
        CHECK(url.is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/live");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.port() == "8080");
        CHECK(!url.is_secure());
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/a.m3u8?token=abc#t=10");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.path() == "/a.m3u8");
        CHECK(url.query() == "token=abc");
        CHECK(url.fragment() == "t=10");
    }

    SECTION("Host only") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        auto result = Url::parse("example.com/master.m3u8");
        REQUIRE(!result.has_value());
        CHECK(result.error() == TransportErrc::invalid_url);
    }

    SECTION("Empty string") {
        auto result = Url::parse("");
        REQUIRE(!result.has_value());
    }

    SECTION("Missing host") {
        auto result = Url::parse("https:///path");
        REQUIRE(!result.has_value());
    }
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        auto result = Url::parse("https://example.com/hls/index.m3u8");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "index.m3u8");
    }

    SECTION("Path without filename") {
        auto result = Url::parse("https://example.com/folder/");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "index.html");
    }
}

TEST_CASE("Url::directory", "[url]") {
    CHECK(Url::parse("https://example.com/a/b/master.m3u8")->directory() == "https://example.com/a/b/");
    CHECK(Url::parse("https://example.com:8443/x.m3u8?q=1")->directory() == "https://example.com:8443/");
}

TEST_CASE("resolve_url", "[url]") {
    const std::string base = "https://cdn.example.com/hls/v1/master.m3u8?token=abc";

    SECTION("Absolute reference passes through") {
        CHECK(resolve_url(base, "http://other.example.net/x.m3u8") == "http://other.example.net/x.m3u8");
    }

    SECTION("Relative reference uses the base directory") {
        CHECK(resolve_url(base, "720p/index.m3u8") == "https://cdn.example.com/hls/v1/720p/index.m3u8");
    }

    SECTION("Base query is not carried over") {
        CHECK(resolve_url(base, "seg1.ts") == "https://cdn.example.com/hls/v1/seg1.ts");
    }

    SECTION("Reference query is kept") {
        CHECK(resolve_url(base, "seg1.ts?sig=x") == "https://cdn.example.com/hls/v1/seg1.ts?sig=x");
    }

    SECTION("Root-relative reference") {
        CHECK(resolve_url(base, "/other/seg1.ts") == "https://cdn.example.com/other/seg1.ts");
    }

    SECTION("Scheme-relative reference") {
        CHECK(resolve_url(base, "//edge.example.com/seg1.ts") == "https://edge.example.com/seg1.ts");
    }

    SECTION("Dot segments") {
        CHECK(resolve_url(base, "../v2/./seg1.ts") == "https://cdn.example.com/hls/v2/seg1.ts");
    }

    SECTION("Empty path segments are kept") {
        CHECK(resolve_url(base, "a//b/seg1.ts") == "https://cdn.example.com/hls/v1/a//b/seg1.ts");
        CHECK(resolve_url("https://cdn.example.com/x//y/index.m3u8", "seg1.ts")
              == "https://cdn.example.com/x//y/seg1.ts");
        CHECK(resolve_url(base, "../") == "https://cdn.example.com/hls/");
    }

    SECTION("Query-only reference keeps the base path") {
        CHECK(resolve_url(base, "?token=new") == "https://cdn.example.com/hls/v1/master.m3u8?token=new");
    }

    SECTION("Fragment-only reference keeps the base query") {
        CHECK(resolve_url(base, "#t=5") == "https://cdn.example.com/hls/v1/master.m3u8?token=abc#t=5");
    }
}

TEST_CASE("is_absolute_url", "[url]") {
    CHECK(is_absolute_url("https://example.com/x"));
    CHECK(is_absolute_url("http://example.com"));
    CHECK_FALSE(is_absolute_url("seg1.ts"));
    CHECK_FALSE(is_absolute_url("/abs/seg1.ts"));
    CHECK_FALSE(is_absolute_url("seg.ts?u=http://x"));
}
