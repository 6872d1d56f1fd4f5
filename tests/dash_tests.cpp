// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/media/dash_parser.hpp>
#include <reel/core/error.hpp>

using namespace reel::media;

namespace {

constexpr std::string_view TEMPLATE_MPD = R"(<?xml version="1.0" encoding="UTF-8"?>
<!-- packaged for testing -->
<MPD xmlns="urn:mpeg:dash:schema:mpd:2011" type="static"
     mediaPresentationDuration="PT0M25.0S" minBufferTime="PT2S">
  <Period id="p0">
    <AdaptationSet id="1" mimeType="video/mp4" contentType="video">
      <SegmentTemplate timescale="1000" duration="4000" startNumber="1"
                       initialization="$RepresentationID$/init.mp4"
                       media="$RepresentationID$/seg-$Number%05d$.m4s"/>
      <Representation id="720p" bandwidth="3000000" codecs="avc1.64001f" width="1280" height="720"/>
      <Representation id="360p" bandwidth="800000" width="640" height="360"/>
    </AdaptationSet>
    <AdaptationSet id="2" mimeType="audio/mp4">
      <Representation id="aac" bandwidth="128000">
        <SegmentTemplate timescale="48000" duration="192000" media="audio/$Number$.m4s"/>
      </Representation>
    </AdaptationSet>
  </Period>
</MPD>
)";

constexpr std::string_view TIMELINE_MPD = R"(<MPD mediaPresentationDuration="PT12S">
  <BaseURL>https://media.example.com/content/</BaseURL>
  <Period>
    <AdaptationSet mimeType="video/mp4">
      <Representation id="v1" bandwidth="1000">
        <SegmentTemplate timescale="10" media="chunk_$Time$.m4s" initialization="init_$RepresentationID$.m4s">
          <SegmentTimeline>
            <S t="0" d="20" r="2"/>
            <S d="30"/>
            <S d="15" r="-1"/>
          </SegmentTimeline>
        </SegmentTemplate>
      </Representation>
    </AdaptationSet>
  </Period>
</MPD>)";

} // namespace

TEST_CASE("DASHParser - duration based template", "[dash]") {
    auto manifest = DASHParser::parse(TEMPLATE_MPD, "https://cdn.example.com/movie/manifest.mpd");
    REQUIRE(manifest.has_value());

    CHECK(manifest->duration_sec == Catch::Approx(25.0));
    CHECK(manifest->min_buffer_time == Catch::Approx(2.0));
    CHECK_FALSE(manifest->is_live);
    REQUIRE(manifest->adaptation_sets.size() == 2);

    const auto& video = manifest->adaptation_sets[0];
    CHECK(video.content_type == "video");
    REQUIRE(video.representations.size() == 2);

    const auto& rep = video.representations[0];
    CHECK(rep.id == "720p");
    CHECK(rep.bandwidth == 3000000);
    CHECK(rep.mime_type == "video/mp4");
    CHECK(rep.width == 1280);
    CHECK(rep.count_known);
    CHECK(rep.initialization_url == "https://cdn.example.com/movie/720p/init.mp4");

    // ceil(25 s / 4 s) = 7 segments
    REQUIRE(rep.segment_urls.size() == 7);
    CHECK(rep.segment_urls.front() == "https://cdn.example.com/movie/720p/seg-00001.m4s");
    CHECK(rep.segment_urls.back() == "https://cdn.example.com/movie/720p/seg-00007.m4s");

    const auto& audio = manifest->adaptation_sets[1].representations[0];
    CHECK(audio.mime_type == "audio/mp4");
    CHECK(audio.segment_urls.size() == 7);
    CHECK(audio.segment_urls[0] == "https://cdn.example.com/movie/audio/1.m4s");
}

TEST_CASE("DASHParser::segment_urls - first template representation", "[dash]") {
    auto manifest = DASHParser::parse(TEMPLATE_MPD, "https://cdn.example.com/movie/manifest.mpd");
    REQUIRE(manifest.has_value());

    auto urls = DASHParser::segment_urls(*manifest);
    REQUIRE(urls.has_value());
    REQUIRE(urls->size() == 8);
    CHECK((*urls)[0] == "https://cdn.example.com/movie/720p/init.mp4");
    CHECK((*urls)[1] == "https://cdn.example.com/movie/720p/seg-00001.m4s");
}

TEST_CASE("DASHParser - segment timeline with repeats", "[dash]") {
    auto manifest = DASHParser::parse(TIMELINE_MPD, "https://origin.example.com/x.mpd");
    REQUIRE(manifest.has_value());

    auto urls = DASHParser::segment_urls(*manifest);
    REQUIRE(urls.has_value());

    // 3 x 2 s, 1 x 3 s, then 1.5 s chunks until the 12 s period ends
    std::vector<std::string> expected{
        "https://media.example.com/content/init_v1.m4s",
        "https://media.example.com/content/chunk_0.m4s",
        "https://media.example.com/content/chunk_20.m4s",
        "https://media.example.com/content/chunk_40.m4s",
        "https://media.example.com/content/chunk_60.m4s",
        "https://media.example.com/content/chunk_90.m4s",
        "https://media.example.com/content/chunk_105.m4s",
    };
    CHECK(*urls == expected);
}

TEST_CASE("DASHParser - count that cannot be derived", "[dash]") {
    SECTION("Template without duration or timeline") {
        auto manifest = DASHParser::parse(R"(<MPD mediaPresentationDuration="PT10S"><Period><AdaptationSet>
            <Representation id="a"><SegmentTemplate media="$Number$.m4s"/></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        auto urls = DASHParser::segment_urls(*manifest);
        REQUIRE_FALSE(urls.has_value());
        CHECK(urls.error() == reel::core::FetchErrc::invalid_manifest);
    }

    SECTION("Live manifest without a presentation duration") {
        auto manifest = DASHParser::parse(R"(<MPD type="dynamic"><Period><AdaptationSet>
            <Representation id="a"><SegmentTemplate duration="2" media="$Number$.m4s"/></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        CHECK(manifest->is_live);
        CHECK_FALSE(DASHParser::segment_urls(*manifest).has_value());
    }

    SECTION("No template at all") {
        auto manifest = DASHParser::parse(R"(<MPD><Period><AdaptationSet>
            <Representation id="a"><BaseURL>file.mp4</BaseURL></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        CHECK(manifest->adaptation_sets[0].representations[0].base_url == "https://x.test/file.mp4");
        CHECK_FALSE(DASHParser::segment_urls(*manifest).has_value());
    }
}

TEST_CASE("DASHParser - oversized segment counts are rejected", "[dash]") {
    SECTION("Huge timeline repeat") {
        auto manifest = DASHParser::parse(R"(<MPD mediaPresentationDuration="PT10S"><Period><AdaptationSet>
            <Representation id="a"><SegmentTemplate media="$Time$.m4s"><SegmentTimeline>
            <S t="0" d="1" r="4000000000"/></SegmentTimeline></SegmentTemplate></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        CHECK(manifest->adaptation_sets[0].representations[0].segment_urls.empty());
        auto urls = DASHParser::segment_urls(*manifest);
        REQUIRE_FALSE(urls.has_value());
        CHECK(urls.error() == reel::core::FetchErrc::invalid_manifest);
    }

    SECTION("Long presentation over tiny segments") {
        auto manifest = DASHParser::parse(R"(<MPD mediaPresentationDuration="PT1000000H"><Period><AdaptationSet>
            <Representation id="a"><SegmentTemplate timescale="1000" duration="1" media="$Number$.m4s"/></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        CHECK(manifest->adaptation_sets[0].representations[0].segment_urls.empty());
        CHECK_FALSE(DASHParser::segment_urls(*manifest).has_value());
    }

    SECTION("At the limit") {
        auto manifest = DASHParser::parse(R"(<MPD mediaPresentationDuration="PT100000S"><Period><AdaptationSet>
            <Representation id="a"><SegmentTemplate duration="1" media="$Number$.m4s"/></Representation>
            </AdaptationSet></Period></MPD>)", "https://x.test/m.mpd");
        REQUIRE(manifest.has_value());
        auto urls = DASHParser::segment_urls(*manifest);
        REQUIRE(urls.has_value());
        CHECK(urls->size() == MAX_DASH_SEGMENTS);
    }
}

TEST_CASE("DASHParser - rejects non-MPD content", "[dash]") {
    auto manifest = DASHParser::parse("<html><body>404</body></html>", "https://x.test/m.mpd");
    REQUIRE_FALSE(manifest.has_value());
    CHECK(manifest.error() == reel::core::FetchErrc::invalid_manifest);
}

TEST_CASE("DASHParser - Period duration stands in for the presentation duration", "[dash]") {
    auto manifest = DASHParser::parse(R"(<mpd:MPD xmlns:mpd="urn:mpeg:dash:schema:mpd:2011">
        <mpd:Period duration="PT6S"><mpd:AdaptationSet>
        <mpd:SegmentTemplate duration="2" media="s$Number$.ts?a=1&amp;b=2"/>
        <mpd:Representation id="r"/>
        </mpd:AdaptationSet></mpd:Period></mpd:MPD>)", "https://x.test/dir/m.mpd");
    REQUIRE(manifest.has_value());
    CHECK(manifest->duration_sec == Catch::Approx(6.0));

    auto urls = DASHParser::segment_urls(*manifest);
    REQUIRE(urls.has_value());
    CHECK(*urls == std::vector<std::string>{
        "https://x.test/dir/s1.ts?a=1&b=2", "https://x.test/dir/s2.ts?a=1&b=2", "https://x.test/dir/s3.ts?a=1&b=2"});
}

TEST_CASE("parse_iso8601_duration", "[dash]") {
    CHECK(parse_iso8601_duration("PT1H2M3.5S").value_or(-1) == Catch::Approx(3723.5));
    CHECK(parse_iso8601_duration("PT634.566S").value_or(-1) == Catch::Approx(634.566));
    CHECK(parse_iso8601_duration("P1DT1S").value_or(-1) == Catch::Approx(86401.0));
    CHECK(parse_iso8601_duration("PT0S").value_or(-1) == Catch::Approx(0.0));
    CHECK_FALSE(parse_iso8601_duration("1H").has_value());
    CHECK_FALSE(parse_iso8601_duration("PT").has_value());
    CHECK_FALSE(parse_iso8601_duration("PT5X").has_value());
}

TEST_CASE("expand_template", "[dash]") {
    CHECK(expand_template("$RepresentationID$/$Number$.m4s", "v1", 0, 7, 0) == "v1/7.m4s");
    CHECK(expand_template("seg-$Number%04d$.m4s", "", 0, 42, 0) == "seg-0042.m4s");
    CHECK(expand_template("t$Time$_b$Bandwidth$", "", 5000, 0, 900) == "t900_b5000");
    CHECK(expand_template("price$$.m4s", "", 0, 0, 0) == "price$.m4s");
    CHECK(expand_template("$Unknown$.m4s", "", 0, 0, 0) == "$Unknown$.m4s");
}

TEST_CASE("DASHParser::is_dash_url", "[dash]") {
    CHECK(DASHParser::is_dash_url("https://a.test/manifest.mpd"));
    CHECK(DASHParser::is_dash_url("https://a.test/Manifest.MPD?x=1"));
    CHECK_FALSE(DASHParser::is_dash_url("https://a.test/master.m3u8"));
}
