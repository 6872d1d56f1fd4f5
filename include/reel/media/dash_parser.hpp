// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::media {

// Representations listing more segments are rejected as invalid_manifest
constexpr std::uint64_t MAX_DASH_SEGMENTS = 100'000;

// <S t= d= r=> entry of a SegmentTimeline
struct DASHTimelineEntry {
    std::optional<std::uint64_t> time;
    std::uint64_t duration{0};
    std::int64_t repeat{0};          // -1 repeats until the period ends
};

// <SegmentTemplate>; a Representation's template refines its AdaptationSet's
struct DASHSegmentTemplate {
    std::string media;
    std::string initialization;
    std::uint64_t timescale{1};
    std::uint64_t duration{0};       // In timescale units
    std::uint64_t start_number{1};
    std::vector<DASHTimelineEntry> timeline;
    bool present{false};
};

// DASH (Dynamic Adaptive Streaming over HTTP) representation
struct DASHRepresentation {
    std::string id;
    std::uint64_t bandwidth{0};     // Bitrate in bps
    std::string mime_type;          // "video/mp4" or "audio/mp4"
    std::string codecs;
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::string base_url;           // Absolute, after BaseURL resolution
    DASHSegmentTemplate segment_template;
    std::string initialization_url;
    std::vector<std::string> segment_urls;
    bool count_known{false};        // segment_urls reflects the whole period
};

// DASH adaptation set (group of representations)
struct DASHAdaptationSet {
    std::string id;
    std::string mime_type;
    std::string content_type;       // "video" or "audio"
    std::vector<DASHRepresentation> representations;
};

// DASH manifest (MPD)
struct DASHManifest {
    std::vector<DASHAdaptationSet> adaptation_sets;
    double duration_sec{0.0};       // mediaPresentationDuration, else the Period duration
    double min_buffer_time{0.0};
    bool is_live{false};
};

// DASH MPD parser
class DASHParser {
public:
    // Parse MPD manifest content; URLs are resolved against base_url and any BaseURL elements.
    // invalid_manifest when there is no MPD root element.
    [[nodiscard]] static std::expected<DASHManifest, std::error_code>
    parse(std::string_view content, std::string_view base_url);

    // Check if URL is a DASH manifest
    [[nodiscard]] static bool is_dash_url(std::string_view url) noexcept;

    // Initialization URL (if any) followed by the media URLs of the first
    // Representation with a SegmentTemplate. invalid_manifest when there is
    // none or its segment count cannot be derived.
    [[nodiscard]] static std::expected<std::vector<std::string>, std::error_code>
    segment_urls(const DASHManifest& manifest);
};

// "PT1H2M3.5S" style xs:duration in seconds
[[nodiscard]] std::optional<double> parse_iso8601_duration(std::string_view text) noexcept;

// Substitute $RepresentationID$, $Bandwidth$, $Number$, $Time$ (with optional %0Nd) and $$
[[nodiscard]] std::string expand_template(std::string_view pattern, std::string_view representation_id,
                                          std::uint64_t bandwidth, std::uint64_t number, std::uint64_t time);

} // namespace reel::media
