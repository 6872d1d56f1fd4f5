// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/segment.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <format>
#include <new>

namespace reel::core {

std::string segment_file_name(std::uint32_t index, std::string_view extension) {
    return std::format("segment_{}{}", index, extension);
}

SegmentResult SegmentJob::run(const SegmentSpec& spec, std::string_view directory,
                              std::stop_token stoken) noexcept {
    SegmentResult result;
    result.index = spec.index;

    if (stoken.stop_requested()) {
        state_ = SegmentState::cancelled;
        result.error = make_error_code(FetchErrc::cancelled);
        return result;
    }

    try {
        auto path = (std::filesystem::path(directory) /
                     segment_file_name(spec.index, config_.segment_extension)).string();

        Fetcher fetcher(transport_, config_, std::move(stoken));
        fetcher.label(std::format("segment {}", spec.index));
        if (progress_cb_) {
            fetcher.callback(progress_cb_);
        }

        state_ = SegmentState::downloading;
        auto fetched = fetcher.fetch(spec.url, path);

        result.attempts = fetcher.state().attempts;
        result.bytes = fetcher.state().bytes_on_disk;

        if (!fetched) {
            result.error = fetched.error();
            result.cause = fetcher.state().last_error;
            state_ = result.error == FetchErrc::cancelled ? SegmentState::cancelled
                                                          : SegmentState::failed;
            return result;
        }

        result.local_path = std::move(path);
        state_ = SegmentState::completed;
    } catch (const std::bad_alloc&) {
        state_ = SegmentState::failed;
        result.error = std::make_error_code(std::errc::not_enough_memory);
    }
    return result;
}

} // namespace reel::core
