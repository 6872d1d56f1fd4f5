// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/orchestrator.hpp>
#include <reel/core/worker_pool.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <set>

namespace reel::core {

std::error_code validate_specs(const std::vector<SegmentSpec>& specs) noexcept {
    std::set<std::uint32_t> seen;
    for (const auto& spec : specs) {
        if (spec.index == 0) {
            return make_error_code(FetchErrc::invalid_argument);
        }
        if (!seen.insert(spec.index).second) {
            return make_error_code(FetchErrc::invalid_argument);
        }
    }
    return {};
}

//=============================================================================
// Orchestrator
//=============================================================================

Orchestrator::Orchestrator(HttpTransport& transport, EngineConfig config)
    : transport_(transport)
    , config_(std::move(config)) {}

JobOutcome Orchestrator::run(const std::vector<SegmentSpec>& specs, const std::string& directory) {
    if (auto ec = config_.validate()) {
        return std::unexpected(JobFailure{0, ec, {}});
    }
    if (auto ec = validate_specs(specs)) {
        return std::unexpected(JobFailure{0, ec, {}});
    }
    if (auto ec = disk::ensure_directory(directory)) {
        return std::unexpected(JobFailure{0, ec, {}});
    }

    {
        std::lock_guard lock(results_mutex_);
        results_.clear();
        first_failure_.reset();
    }
    {
        std::lock_guard lock(callback_mutex_);
        reported_ = 0;
    }

    const std::size_t total = specs.size();
    auto stoken = stop_source_.get_token();

    spdlog::info("Fetching {} segments with {} workers", total, config_.worker_count);

    {
        WorkerPool pool(config_.worker_count);
        for (const auto& spec : specs) {
            bool queued = pool.submit([this, &pool, &spec, &directory, stoken, total] {
                // Queued before a failure, dequeued after it
                if (stoken.stop_requested()) {
                    return;
                }
                SegmentJob job(transport_, config_);
                auto result = job.run(spec, directory, stoken);
                bool failed = !result.ok();
                record(std::move(result), total);
                if (failed) {
                    pool.discard_pending();
                }
            });
            if (!queued) {
                break;
            }
        }
        pool.wait();
    }

    std::lock_guard lock(results_mutex_);

    if (first_failure_) {
        return std::unexpected(*first_failure_);
    }

    if (results_.size() != total) {
        spdlog::info("Cancelled with {}/{} segments done", results_.size(), total);
        return std::unexpected(JobFailure{0, make_error_code(FetchErrc::cancelled), {}});
    }

    // std::map iterates in index order
    std::vector<std::string> paths;
    paths.reserve(results_.size());
    for (auto& [index, result] : results_) {
        paths.push_back(std::move(result.local_path));
    }
    return paths;
}

void Orchestrator::record(SegmentResult result, std::size_t total) {
    {
        std::lock_guard lock(results_mutex_);

        if (!result.ok()) {
            // Segments stopped by fail-fast or cancel() are not the cause
            if (result.error == FetchErrc::cancelled) {
                return;
            }
            if (!first_failure_) {
                spdlog::error("Segment {} failed after {} attempts: {}{}", result.index, result.attempts,
                              result.error.message(),
                              result.cause ? " (" + result.cause.message() + ")" : std::string{});
                first_failure_ = JobFailure{result.index, result.error, result.cause};
                stop_source_.request_stop();
            }
            return;
        }

        spdlog::debug("Segment {} done ({} bytes)", result.index, result.bytes);
        results_.emplace(result.index, std::move(result));
    }

    if (callback_) {
        std::lock_guard lock(callback_mutex_);
        callback_(JobProgress{++reported_, total});
    }
}

} // namespace reel::core
