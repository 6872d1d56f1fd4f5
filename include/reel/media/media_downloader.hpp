// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/media/assembler.hpp>
#include <reel/media/hls_parser.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

enum class MediaKind : std::uint8_t {
    direct,     // Plain file
    hls,        // .m3u8
    dash        // .mpd
};

// By URL extension
[[nodiscard]] MediaKind detect_kind(std::string_view url) noexcept;

// By Content-Type: application/dash+xml, the HLS mpegurl types, else direct
[[nodiscard]] MediaKind kind_from_content_type(std::string_view content_type) noexcept;

// Where a download failed
enum class Stage : std::uint8_t {
    fetch,          // Manifest, direct file or setup
    orchestration,  // A segment exhausted its retries
    assembly        // Muxer failed
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

struct StageError {
    Stage stage{Stage::fetch};
    std::uint32_t index{0};         // Failing segment, 0 when none
    std::error_code error;
    std::error_code cause;

    // "orchestration failed at segment 3: Retries exhausted (Network error)"
    [[nodiscard]] std::string message() const;
};

// Output path, or the stage that failed
using MediaResult = std::expected<std::string, StageError>;

struct MediaRequest {
    std::string url;
    std::string directory{"downloads"};
    std::string name;               // Output base name; derived from the URL when empty
    std::uint32_t quality{0};       // 1-based HLS variant, 0 = highest bandwidth
    bool subtitles{true};
};

// Segments done for streams, bytes for direct files
struct MediaProgress {
    std::uint64_t completed{0};
    std::uint64_t total{0};         // 0 when unknown
    bool bytes{false};
};

using MediaProgressCallback = std::function<void(const MediaProgress&)>;

// Manifest -> orchestrator -> assembler pipeline, plus direct files
class MediaDownloader {
public:
    MediaDownloader(core::HttpTransport& transport, core::EngineConfig config, Muxer& muxer);

    // Non-copyable
    MediaDownloader(const MediaDownloader&) = delete;
    MediaDownloader& operator=(const MediaDownloader&) = delete;

    // Dispatch on detect_kind(request.url); when that says direct, a HEAD
    // request's Content-Type can still pick HLS or DASH
    [[nodiscard]] MediaResult download(const MediaRequest& request);

    [[nodiscard]] MediaResult download_hls(const MediaRequest& request);
    [[nodiscard]] MediaResult download_dash(const MediaRequest& request);
    [[nodiscard]] MediaResult download_direct(const MediaRequest& request);

    // Fetch subtitle renditions to "subtitle_<lang><ext>"; failures are
    // logged and skipped. Returns the saved paths.
    std::vector<std::string> download_subtitles(const std::vector<HLSSubtitle>& subtitles,
                                                const std::string& directory);

    // Set progress callback
    void callback(MediaProgressCallback cb) noexcept { callback_ = std::move(cb); }

    // Cancel download (any thread)
    void cancel() noexcept { stop_.request_stop(); }

private:
    [[nodiscard]] std::expected<std::string, std::error_code> fetch_manifest(const std::string& url);

    // Content-Type of a HEAD request, empty when it fails
    [[nodiscard]] std::string probe_content_type(const std::string& url);

    [[nodiscard]] MediaResult save_direct(const MediaRequest& request, const std::string& content_type);

    // Orchestrate, then assemble "<name>.mp4"
    [[nodiscard]] MediaResult run_segments(const std::vector<std::string>& urls,
                                           const std::string& directory, const std::string& name);

    [[nodiscard]] std::string output_name(const MediaRequest& request) const;

    core::HttpTransport& transport_;
    core::EngineConfig config_;
    Muxer& muxer_;
    std::stop_source stop_;
    MediaProgressCallback callback_;
};

// Extension for a direct file: from the URL path, else from a video
// Content-Type, else ".bin"
[[nodiscard]] std::string guess_extension(std::string_view url_extension, std::string_view content_type);

} // namespace reel::media
