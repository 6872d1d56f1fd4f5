// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/segment.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace reel::core {

// Why a job failed: the first segment to fail terminally
struct JobFailure {
    std::uint32_t index{0};           // 0 when no segment is to blame
    std::error_code error;
    std::error_code cause;
};

// All local paths in index order, or the one failure that stopped the job
using JobOutcome = std::expected<std::vector<std::string>, JobFailure>;

struct JobProgress {
    std::size_t completed{0};
    std::size_t total{0};
};

using JobCallback = std::function<void(const JobProgress&)>;

// Runs every SegmentJob of a job on a bounded worker pool.
//
// The first terminal failure cancels everything not yet started; jobs in
// flight stop at their next attempt boundary. Results are sorted by index
// before they are returned, whatever the completion order. One Orchestrator
// runs one job: after a failure or cancel() every later run() is cancelled.
class Orchestrator {
public:
    Orchestrator(HttpTransport& transport, EngineConfig config);

    // Non-copyable, non-movable (workers reference members)
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    [[nodiscard]] JobOutcome run(const std::vector<SegmentSpec>& specs, const std::string& directory);

    // Cooperative; safe from any thread
    void cancel() noexcept { stop_source_.request_stop(); }

    // Called from worker threads after every finished segment, one call at
    // a time with completed counting up by one
    void callback(JobCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void record(SegmentResult result, std::size_t total);

    HttpTransport& transport_;
    EngineConfig config_;
    std::stop_source stop_source_;
    JobCallback callback_;

    std::mutex results_mutex_;
    std::map<std::uint32_t, SegmentResult> results_;
    std::optional<JobFailure> first_failure_;

    // Serializes callback_ apart from results_mutex_
    std::mutex callback_mutex_;
    std::size_t reported_{0};
};

// Rejects index 0 and repeated indices
[[nodiscard]] std::error_code validate_specs(const std::vector<SegmentSpec>& specs) noexcept;

} // namespace reel::core
