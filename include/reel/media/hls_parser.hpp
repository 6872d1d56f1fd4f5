// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::media {

// HLS (HTTP Live Streaming) segment
struct HLSSegment {
    std::string url;                // Absolute
    double duration{0.0};           // Segment duration in seconds
};

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bitrate in bps
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::string codecs;
    std::string url;                // Absolute
};

// #EXT-X-MEDIA rendition with TYPE=SUBTITLES
struct HLSSubtitle {
    std::string language;           // May be empty
    std::string name;
    std::string url;                // Absolute
};

// Parsed HLS playlist: a media playlist fills segments, a master playlist
// fills variants and subtitles
struct HLSPlaylist {
    std::vector<HLSSegment> segments;
    std::vector<HLSVariant> variants;
    std::vector<HLSSubtitle> subtitles;
    double target_duration{0.0};
    double total_duration{0.0};
    bool has_endlist{false};

    [[nodiscard]] bool is_master() const noexcept { return !variants.empty(); }
};

// HLS M3U8 parser
class HLSParser {
public:
    // Parse M3U8 playlist content; relative URIs are resolved against base_url.
    // invalid_manifest when the #EXTM3U header is missing.
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content, std::string_view base_url);

    // Check if URL is an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;

    // KEY=VALUE,KEY="quoted, value" attribute list
    [[nodiscard]] static std::map<std::string, std::string> parse_attributes(std::string_view text);
};

// Variant picked by a 1-based quality index, or the highest bandwidth when
// quality is 0; nullptr for an out-of-range index or an empty list
[[nodiscard]] const HLSVariant* select_variant(const std::vector<HLSVariant>& variants,
                                               std::uint32_t quality) noexcept;

} // namespace reel::media
