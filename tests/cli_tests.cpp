// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/error.hpp>
#include "test_support.hpp"
#include <initializer_list>

using namespace reel::cli;
using namespace reel::test;

namespace {

CliArgs parse(std::initializer_list<std::string> words) {
    std::vector<std::string> storage{"reel"};
    storage.insert(storage.end(), words);
    std::vector<char*> argv;
    for (auto& w : storage) {
        argv.push_back(w.data());
    }
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(storage.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args - defaults", "[cli]") {
    auto args = parse({"https://a.test/master.m3u8"});
    CHECK(args.error.empty());
    CHECK(args.url == "https://a.test/master.m3u8");
    CHECK(args.output_dir == "downloads");
    CHECK(args.name.empty());
    CHECK_FALSE(args.parallel.has_value());
    CHECK_FALSE(args.retries.has_value());
    CHECK_FALSE(args.backoff.has_value());
    CHECK(args.quality == 0);
    CHECK(args.subtitles);
}

TEST_CASE("parse_args - every option", "[cli]") {
    auto args = parse({"-d", "out", "-o", "movie", "-p", "8", "-r", "3", "-b", "0.5",
                       "-c", "reel.json", "-q", "2", "--no-subtitles", "-V", "--quiet",
                       "https://a.test/manifest.mpd"});
    REQUIRE(args.error.empty());
    CHECK(args.output_dir == "out");
    CHECK(args.name == "movie");
    CHECK(args.parallel == 8u);
    CHECK(args.retries == 3u);
    CHECK(args.backoff == 0.5);
    CHECK(args.config_file == "reel.json");
    CHECK(args.quality == 2);
    CHECK_FALSE(args.subtitles);
    CHECK(args.verbose);
    CHECK(args.quiet);
}

TEST_CASE("parse_args - long forms", "[cli]") {
    auto args = parse({"--directory", "d", "--name", "n", "--parallel", "2", "--retries", "1",
                       "--backoff", "3", "--config", "c.json", "--quality", "1", "--verbose",
                       "https://a.test/x.mp4"});
    REQUIRE(args.error.empty());
    CHECK(args.output_dir == "d");
    CHECK(args.name == "n");
    CHECK(args.parallel == 2u);
    CHECK(args.retries == 1u);
    CHECK(args.backoff == 3.0);
    CHECK(args.config_file == "c.json");
    CHECK(args.quality == 1);
    CHECK(args.verbose);
}

TEST_CASE("parse_args - help and version", "[cli]") {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--help", "--bogus"}).help);
    CHECK(parse({"-v"}).version);
    CHECK(parse({"--version"}).version);
}

TEST_CASE("parse_args - usage errors", "[cli]") {
    CHECK_FALSE(parse({}).error.empty());
    CHECK_FALSE(parse({"-p", "many", "https://a.test/x.mp4"}).error.empty());
    CHECK_FALSE(parse({"-p", "-1", "https://a.test/x.mp4"}).error.empty());
    CHECK_FALSE(parse({"-b", "soon", "https://a.test/x.mp4"}).error.empty());
    CHECK_FALSE(parse({"https://a.test/x.mp4", "-d"}).error.empty());
    CHECK_FALSE(parse({"--frobnicate", "https://a.test/x.mp4"}).error.empty());
    CHECK_FALSE(parse({"https://a.test/a.mp4", "https://a.test/b.mp4"}).error.empty());
}

TEST_CASE("build_config - flags override the file", "[cli][config]") {
    TempDir dir;
    write_file(dir.file("reel.json"), R"({"worker_count": 6, "max_attempts": 7})");

    auto args = parse({"-c", dir.file("reel.json"), "-p", "2", "https://a.test/x.mp4"});
    REQUIRE(args.error.empty());

    auto cfg = build_config(args);
    REQUIRE(cfg.has_value());
    CHECK(cfg->worker_count == 2);
    CHECK(cfg->max_attempts == 7);
}

TEST_CASE("build_config - rejects invalid values", "[cli][config]") {
    SECTION("Zero workers") {
        auto cfg = build_config(parse({"-p", "0", "https://a.test/x.mp4"}));
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == reel::core::FetchErrc::invalid_config);
    }

    SECTION("Zero retries") {
        CHECK_FALSE(build_config(parse({"-r", "0", "https://a.test/x.mp4"})).has_value());
    }

    SECTION("Negative backoff") {
        CHECK_FALSE(build_config(parse({"-b", "-2", "https://a.test/x.mp4"})).has_value());
    }

    SECTION("Missing config file") {
        CHECK_FALSE(build_config(parse({"-c", "/nonexistent/reel.json", "https://a.test/x.mp4"})).has_value());
    }
}

TEST_CASE("ProgressBar formatting", "[cli][progress]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(5 * 1024 * 1024) == "5.0 MB");
    CHECK(ProgressBar::format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB");

    CHECK(ProgressBar::format_time(42) == "42s");
    CHECK(ProgressBar::format_time(125) == "2m 5s");
    CHECK(ProgressBar::format_time(3725) == "1h 02m 5s");
}

TEST_CASE("ProgressBar::render", "[cli][progress]") {
    SECTION("Segment counts") {
        ProgressBar bar(4, "Segments");
        auto line = bar.render(2, 0);
        CHECK(line.starts_with("Segments: ["));
        CHECK(line.find(" 50%") != std::string::npos);
        CHECK(line.find("(2/4)") != std::string::npos);
    }

    SECTION("Bytes with speed and ETA") {
        ProgressBar bar(4096, "Downloading", ProgressBar::Unit::bytes);
        auto line = bar.render(2048, 1024);
        CHECK(line.find("(2 KB/4 KB)") != std::string::npos);
        CHECK(line.find("@ 1 KB/s") != std::string::npos);
        CHECK(line.find("ETA: 2s") != std::string::npos);
    }

    SECTION("Unknown total") {
        ProgressBar bar(0, "Downloading", ProgressBar::Unit::bytes);
        CHECK(bar.render(1024, 0) == "Downloading: 1 KB");
    }
}
