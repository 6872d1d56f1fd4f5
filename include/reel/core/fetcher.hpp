// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

// Per-fetch bookkeeping; lives only as long as one fetch() call
struct TransferState {
    std::uint64_t bytes_on_disk{0};
    std::uint32_t attempts{0};        // Failed attempts so far
    std::error_code last_error;       // Cause of the most recent failed attempt
};

// (bytes on disk, expected total or 0 when unknown)
using FetchProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

// Single-URL download with range resume, retry and backoff.
//
// The body goes to "<destination>.part" and is renamed onto the destination
// only once complete. A failed fetch leaves the part file for a later resume.
class Fetcher {
public:
    Fetcher(HttpTransport& transport, const EngineConfig& config, std::stop_token stoken = {}) noexcept;

    // Non-copyable
    Fetcher(const Fetcher&) = delete;
    Fetcher& operator=(const Fetcher&) = delete;

    // Download url to destination; returns the final file size.
    // exhausted_retries carries its root cause in state().last_error.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch(const std::string& url, const std::string& destination);

    [[nodiscard]] const TransferState& state() const noexcept { return state_; }

    // Name used in log lines (defaults to the URL)
    void label(std::string name) noexcept { label_ = std::move(name); }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    void callback(FetchProgressCallback cb) noexcept { progress_cb_ = std::move(cb); }

    [[nodiscard]] static std::string part_path(std::string_view destination);

private:
    // One request; an empty error_code means the destination is complete
    [[nodiscard]] std::error_code attempt(const std::string& url, const std::string& part,
                                          const std::string& destination);

    // Sleep backoff_base^attempt seconds; false when cancelled
    [[nodiscard]] bool backoff(std::uint32_t attempt);

    HttpTransport& transport_;
    const EngineConfig& config_;
    std::stop_token stop_;
    TransferState state_;
    std::string label_;
    FetchProgressCallback progress_cb_;
};

} // namespace reel::core
