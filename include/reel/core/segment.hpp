// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/fetcher.hpp>
#include <reel/core/http_session.hpp>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,     // Not started
    downloading, // Fetcher running
    completed,   // Final file in place
    failed,      // Terminal error
    cancelled    // Stopped before or between attempts
};

// One (index, URL) pair of a job; index decides playback order
struct SegmentSpec {
    std::uint32_t index{0};
    std::string url;
};

// Terminal outcome of one segment, produced exactly once per SegmentSpec
struct SegmentResult {
    std::uint32_t index{0};
    std::string local_path;           // Set on success
    std::error_code error;            // Set on failure
    std::error_code cause;            // Last retryable error behind exhausted_retries
    std::uint32_t attempts{0};
    std::uint64_t bytes{0};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// "segment_<index><ext>"
[[nodiscard]] std::string segment_file_name(std::uint32_t index, std::string_view extension);

// Drives one Fetcher to a finished segment file or a terminal error.
// No retries beyond the Fetcher's own.
class SegmentJob {
public:
    SegmentJob(HttpTransport& transport, const EngineConfig& config) noexcept
        : transport_(transport), config_(config) {}

    [[nodiscard]] SegmentResult run(const SegmentSpec& spec, std::string_view directory,
                                    std::stop_token stoken = {}) noexcept;

    [[nodiscard]] SegmentState state() const noexcept { return state_; }

    void callback(FetchProgressCallback cb) noexcept { progress_cb_ = std::move(cb); }

private:
    HttpTransport& transport_;
    const EngineConfig& config_;
    SegmentState state_{SegmentState::pending};
    FetchProgressCallback progress_cb_;
};

} // namespace reel::core
