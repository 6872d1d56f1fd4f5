// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/fetcher.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace reel::core {

Fetcher::Fetcher(HttpTransport& transport, const EngineConfig& config, std::stop_token stoken) noexcept
    : transport_(transport)
    , config_(config)
    , stop_(std::move(stoken)) {}

std::string Fetcher::part_path(std::string_view destination) {
    return std::string(destination) + ".part";
}

std::expected<std::uint64_t, std::error_code>
Fetcher::fetch(const std::string& url, const std::string& destination) {
    state_ = {};
    if (label_.empty()) {
        label_ = url;
    }

    // A finished file from an earlier run is never fetched again
    if (disk::file_exists(destination)) {
        auto size = disk::file_size(destination);
        if (!size) {
            return std::unexpected(size.error());
        }
        state_.bytes_on_disk = *size;
        spdlog::debug("{}: already complete ({} bytes)", label_, *size);
        return *size;
    }

    const auto part = part_path(destination);
    bool restarted = false;

    while (state_.attempts < config_.max_attempts) {
        if (stop_.stop_requested()) {
            return std::unexpected(make_error_code(FetchErrc::cancelled));
        }

        auto ec = attempt(url, part, destination);
        if (!ec) {
            return state_.bytes_on_disk;
        }

        // The part file was truncated; starting over once is free
        if (ec == FetchErrc::range_not_supported && !restarted) {
            restarted = true;
            spdlog::info("{}: server ignored the byte range, restarting from zero", label_);
            continue;
        }

        ++state_.attempts;
        state_.last_error = ec;

        if (!is_retryable(ec) && ec != FetchErrc::range_not_supported) {
            spdlog::debug("{}: terminal error: {}", label_, ec.message());
            return std::unexpected(ec);
        }

        if (state_.attempts >= config_.max_attempts) {
            break;
        }

        spdlog::warn("{}: attempt {}/{} failed: {}", label_, state_.attempts,
                     config_.max_attempts, ec.message());

        if (!backoff(state_.attempts)) {
            return std::unexpected(make_error_code(FetchErrc::cancelled));
        }
    }

    spdlog::warn("{}: giving up after {} attempts: {}", label_, state_.attempts,
                 state_.last_error.message());
    return std::unexpected(make_error_code(FetchErrc::exhausted_retries));
}

std::error_code Fetcher::attempt(const std::string& url, const std::string& part,
                                 const std::string& destination) {
    disk::FileWriter writer;
    if (auto ec = writer.open(part)) {
        return ec;
    }

    std::uint64_t offset = writer.size();
    state_.bytes_on_disk = offset;

    std::optional<std::uint64_t> expected_total;
    bool already_complete = false;

    BodyHandler handler;
    handler.on_response = [&](const HttpResponse& r) -> std::error_code {
        // Resume past the end: either the part is whole or it is garbage
        if (r.status_code == 416 && offset > 0) {
            auto total = content_range_total(r.content_range);
            if (total && *total == offset) {
                already_complete = true;
                expected_total = offset;
                return {};
            }
            if (auto ec = writer.truncate()) return ec;
            offset = 0;
            state_.bytes_on_disk = 0;
            return make_error_code(FetchErrc::range_not_supported);
        }

        if (r.status_code < 200 || r.status_code >= 300) {
            spdlog::debug("{}: HTTP {}", label_, r.status_code);
            return make_error_code(FetchErrc::http_status);
        }

        if (offset > 0) {
            if (r.status_code == 206) {
                auto start = content_range_start(r.content_range);
                if (start && *start != offset) {
                    if (auto ec = writer.truncate()) return ec;
                    offset = 0;
                    state_.bytes_on_disk = 0;
                    return make_error_code(FetchErrc::range_not_supported);
                }
            } else {
                // Full body instead of the requested tail
                spdlog::info("{}: server sent the whole body (HTTP {}), restarting from zero",
                             label_, r.status_code);
                if (auto ec = writer.truncate()) return ec;
                offset = 0;
                state_.bytes_on_disk = 0;
            }
        }

        if (r.content_length) {
            expected_total = offset + *r.content_length;
        }
        return {};
    };

    handler.on_data = [&](const char* data, std::size_t size) -> std::error_code {
        if (already_complete) {
            return {};  // 416 error page
        }
        if (expected_total && writer.size() + size > *expected_total) {
            return make_error_code(FetchErrc::size_mismatch);
        }
        if (auto ec = writer.write(data, size)) {
            return ec;
        }
        state_.bytes_on_disk = writer.size();
        if (progress_cb_) {
            progress_cb_(state_.bytes_on_disk, expected_total.value_or(0));
        }
        return {};
    };

    auto result = transport_.get(url, RequestOptions::from(config_, offset), handler);
    state_.bytes_on_disk = writer.size();
    if (!result) {
        writer.close();
        return result.error();
    }

    if (expected_total && writer.size() < *expected_total) {
        writer.close();
        return make_error_code(FetchErrc::incomplete_body);
    }

    if (auto ec = writer.flush()) {
        return ec;
    }
    writer.close();

    if (auto ec = disk::rename_atomic(part, destination)) {
        return ec;
    }
    return {};
}

bool Fetcher::backoff(std::uint32_t attempt) {
    double seconds = std::min(std::pow(config_.backoff_base, static_cast<double>(attempt)), MAX_BACKOFF_SEC);
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(seconds));

    if (delay.count() > 0) {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        // Only a stop request ends the wait early
        (void)cv.wait_for(lock, stop_, delay, [] { return false; });
    }
    return !stop_.stop_requested();
}

} // namespace reel::core
