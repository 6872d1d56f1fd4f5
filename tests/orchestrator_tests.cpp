// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/orchestrator.hpp>
#include <reel/core/segment.hpp>
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace reel::core;
using namespace reel::test;

namespace {

EngineConfig engine(std::uint32_t workers, std::uint32_t attempts = 5) {
    EngineConfig cfg;
    cfg.worker_count = workers;
    cfg.max_attempts = attempts;
    cfg.backoff_base = 0.0;
    return cfg;
}

std::string segment_url(std::uint32_t index) {
    return std::format("https://cdn.test/stream/seg{}.ts", index);
}

std::vector<SegmentSpec> serve_segments(FakeTransport& transport, std::uint32_t count) {
    std::vector<SegmentSpec> specs;
    for (std::uint32_t i = 1; i <= count; ++i) {
        transport.add(segment_url(i), make_body(20 + i, static_cast<char>('a' + i)));
        specs.push_back({i, segment_url(i)});
    }
    return specs;
}

std::vector<std::string> file_names(const std::vector<std::string>& paths) {
    std::vector<std::string> names;
    for (const auto& p : paths) {
        names.push_back(std::filesystem::path(p).filename().string());
    }
    return names;
}

} // namespace

TEST_CASE("segment_file_name", "[segment]") {
    CHECK(segment_file_name(1, ".ts") == "segment_1.ts");
    CHECK(segment_file_name(42, ".m4s") == "segment_42.m4s");
}

TEST_CASE("SegmentJob - success and failure", "[segment]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(segment_url(3), "payload");
    auto cfg = engine(1, 2);

    SECTION("Completed segment lands under its index name") {
        SegmentJob job(transport, cfg);
        auto result = job.run({3, segment_url(3)}, dir.path());
        REQUIRE(result.ok());
        CHECK(result.index == 3);
        CHECK(result.local_path == dir.file("segment_3.ts"));
        CHECK(result.bytes == 7);
        CHECK(job.state() == SegmentState::completed);
        CHECK(read_file(result.local_path) == "payload");
    }

    SECTION("Failed segment carries its cause") {
        SegmentJob job(transport, cfg);
        auto result = job.run({9, segment_url(9)}, dir.path());
        REQUIRE_FALSE(result.ok());
        CHECK(result.index == 9);
        CHECK(result.error == FetchErrc::exhausted_retries);
        CHECK(result.cause == FetchErrc::http_status);
        CHECK(result.attempts == 2);
        CHECK(result.local_path.empty());
        CHECK(job.state() == SegmentState::failed);
    }

    SECTION("Stopped job never touches the network") {
        std::stop_source stop;
        stop.request_stop();
        SegmentJob job(transport, cfg);
        auto result = job.run({3, segment_url(3)}, dir.path(), stop.get_token());
        CHECK(result.error == FetchErrc::cancelled);
        CHECK(job.state() == SegmentState::cancelled);
        CHECK(transport.total_requests() == 0);
    }
}

TEST_CASE("Orchestrator - output follows index order", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 6);

    // Early segments finish last
    transport.delay(segment_url(1), std::chrono::milliseconds(60));
    transport.delay(segment_url(2), std::chrono::milliseconds(30));

    Orchestrator orchestrator(transport, engine(4));
    auto outcome = orchestrator.run(specs, dir.path());

    REQUIRE(outcome.has_value());
    CHECK(file_names(*outcome) == std::vector<std::string>{
        "segment_1.ts", "segment_2.ts", "segment_3.ts", "segment_4.ts", "segment_5.ts", "segment_6.ts"});
    for (std::uint32_t i = 1; i <= 6; ++i) {
        CHECK(read_file((*outcome)[i - 1]) == make_body(20 + i, static_cast<char>('a' + i)));
    }
}

TEST_CASE("Orchestrator - sparse indices sort numerically", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(segment_url(10), "ten");
    transport.add(segment_url(2), "two");
    transport.add(segment_url(7), "seven");

    Orchestrator orchestrator(transport, engine(2));
    auto outcome = orchestrator.run({{10, segment_url(10)}, {2, segment_url(2)}, {7, segment_url(7)}},
                                    dir.path());

    REQUIRE(outcome.has_value());
    CHECK(file_names(*outcome) == std::vector<std::string>{"segment_2.ts", "segment_7.ts", "segment_10.ts"});
}

TEST_CASE("Orchestrator - one worker and many workers agree", "[orchestrator]") {
    TempDir serial_dir;
    TempDir parallel_dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 8);

    Orchestrator serial(transport, engine(1));
    Orchestrator parallel(transport, engine(8));

    auto a = serial.run(specs, serial_dir.path());
    auto b = parallel.run(specs, parallel_dir.path());

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(file_names(*a) == file_names(*b));
    for (std::size_t i = 0; i < a->size(); ++i) {
        CHECK(read_file((*a)[i]) == read_file((*b)[i]));
    }
}

TEST_CASE("Orchestrator - concurrency stays within the worker count", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 10);
    for (const auto& spec : specs) {
        transport.delay(spec.url, std::chrono::milliseconds(10));
    }

    Orchestrator orchestrator(transport, engine(3));
    REQUIRE(orchestrator.run(specs, dir.path()).has_value());
    CHECK(transport.max_concurrent() <= 3);
    CHECK(transport.total_requests() == 10);
}

TEST_CASE("Orchestrator - five segments, two workers, flaky third segment", "[orchestrator][e2e]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 5);
    transport.fail(segment_url(3), Fault{Fault::Kind::status, 500}, 2);

    Orchestrator orchestrator(transport, engine(2));
    auto outcome = orchestrator.run(specs, dir.path());

    REQUIRE(outcome.has_value());
    CHECK(file_names(*outcome) == std::vector<std::string>{
        "segment_1.ts", "segment_2.ts", "segment_3.ts", "segment_4.ts", "segment_5.ts"});
    CHECK(transport.requests(segment_url(3)) == 3);
    for (std::uint32_t i : {1u, 2u, 4u, 5u}) {
        CHECK(transport.requests(segment_url(i)) == 1);
    }
    for (const auto& path : *outcome) {
        CHECK(exists(path));
        CHECK_FALSE(exists(path + ".part"));
    }
}

TEST_CASE("Orchestrator - first failure stops queued segments", "[orchestrator][failfast]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 6);
    transport.fail(segment_url(2), Fault{Fault::Kind::cut_off, 0, 5}, 3);

    Orchestrator orchestrator(transport, engine(1, 3));
    auto outcome = orchestrator.run(specs, dir.path());

    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().index == 2);
    CHECK(outcome.error().error == FetchErrc::exhausted_retries);
    CHECK(outcome.error().cause == FetchErrc::network_error);

    for (std::uint32_t i = 3; i <= 6; ++i) {
        CHECK(transport.requests(segment_url(i)) == 0);
    }

    // Nothing is cleaned up: the finished segment and the partial one stay
    CHECK(exists(dir.file("segment_1.ts")));
    CHECK(exists(dir.file("segment_2.ts.part")));
    CHECK_FALSE(exists(dir.file("segment_2.ts")));
}

TEST_CASE("Orchestrator - first failure with several workers", "[orchestrator][failfast]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 10);

    // Segment 1 fails while 2 and 3 are still transferring
    transport.delay(segment_url(1), std::chrono::milliseconds(30));
    transport.fail(segment_url(1), Fault{Fault::Kind::status, 404, 0}, 1);
    transport.delay(segment_url(2), std::chrono::milliseconds(200));
    transport.delay(segment_url(3), std::chrono::milliseconds(200));

    Orchestrator orchestrator(transport, engine(3, 1));
    auto outcome = orchestrator.run(specs, dir.path());

    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().index == 1);
    CHECK(outcome.error().error == FetchErrc::exhausted_retries);
    CHECK(outcome.error().cause == FetchErrc::http_status);

    // Transfers already running finish and keep their files
    CHECK(read_file(dir.file("segment_2.ts")) == make_body(22, 'c'));
    CHECK(read_file(dir.file("segment_3.ts")) == make_body(23, 'd'));

    for (std::uint32_t i = 4; i <= 10; ++i) {
        CHECK(transport.requests(segment_url(i)) == 0);
        CHECK_FALSE(exists(dir.file(segment_file_name(i, ".ts"))));
    }
    CHECK(transport.max_concurrent() <= 3);
}

TEST_CASE("Orchestrator - progress reports are serialized", "[orchestrator][progress]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 8);

    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};
    std::vector<std::size_t> counts;

    Orchestrator orchestrator(transport, engine(4));
    orchestrator.callback([&](const JobProgress& p) {
        if (inside.fetch_add(1) != 0) {
            overlapped = true;
        }
        counts.push_back(p.completed);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        inside.fetch_sub(1);
    });

    REQUIRE(orchestrator.run(specs, dir.path()).has_value());
    CHECK_FALSE(overlapped.load());
    CHECK(counts == std::vector<std::size_t>{1, 2, 3, 4, 5, 6, 7, 8});
}

TEST_CASE("Orchestrator - rerun resumes the partial segment", "[orchestrator][resume]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 3);
    transport.fail(segment_url(2), Fault{Fault::Kind::cut_off, 0, 8}, 1);

    {
        Orchestrator first(transport, engine(1, 1));
        REQUIRE_FALSE(first.run(specs, dir.path()).has_value());
    }

    Orchestrator second(transport, engine(1, 1));
    auto outcome = second.run(specs, dir.path());

    REQUIRE(outcome.has_value());
    CHECK(transport.requests(segment_url(1)) == 1);
    CHECK(transport.offsets(segment_url(2)) == std::vector<std::uint64_t>{0, 8});
    CHECK(read_file(dir.file("segment_2.ts")) == make_body(22, 'c'));
}

TEST_CASE("Orchestrator - cancel before run", "[orchestrator][cancel]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 4);

    Orchestrator orchestrator(transport, engine(2));
    orchestrator.cancel();
    auto outcome = orchestrator.run(specs, dir.path());

    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().index == 0);
    CHECK(outcome.error().error == FetchErrc::cancelled);
    CHECK(transport.total_requests() == 0);
}

TEST_CASE("Orchestrator - progress counts finished segments", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    auto specs = serve_segments(transport, 5);

    // Callbacks run on worker threads; assertions stay on this one
    std::vector<JobProgress> reports;
    Orchestrator orchestrator(transport, engine(3));
    orchestrator.callback([&](const JobProgress& p) { reports.push_back(p); });

    REQUIRE(orchestrator.run(specs, dir.path()).has_value());
    REQUIRE(reports.size() == 5);
    for (std::size_t i = 0; i < reports.size(); ++i) {
        CHECK(reports[i].completed == i + 1);
        CHECK(reports[i].total == 5);
    }
}

TEST_CASE("Orchestrator - rejects bad input before any transfer", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    serve_segments(transport, 2);

    SECTION("Index zero") {
        Orchestrator orchestrator(transport, engine(2));
        auto outcome = orchestrator.run({{0, segment_url(1)}}, dir.path());
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().error == FetchErrc::invalid_argument);
    }

    SECTION("Duplicate index") {
        Orchestrator orchestrator(transport, engine(2));
        auto outcome = orchestrator.run({{1, segment_url(1)}, {1, segment_url(2)}}, dir.path());
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().error == FetchErrc::invalid_argument);
    }

    SECTION("Zero workers") {
        Orchestrator orchestrator(transport, engine(0));
        auto outcome = orchestrator.run({{1, segment_url(1)}}, dir.path());
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().error == FetchErrc::invalid_config);
    }

    CHECK(transport.total_requests() == 0);
}

TEST_CASE("Orchestrator - empty job yields no paths", "[orchestrator]") {
    TempDir dir;
    FakeTransport transport;
    Orchestrator orchestrator(transport, engine(2));
    auto outcome = orchestrator.run({}, dir.path());
    REQUIRE(outcome.has_value());
    CHECK(outcome->empty());
}
