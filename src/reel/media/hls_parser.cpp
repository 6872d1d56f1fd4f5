// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/hls_parser.hpp>
#include <reel/core/error.hpp>
#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace reel::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_MEDIA = "#EXT-X-MEDIA:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";

// strtod without exceptions; 0 on garbage
double to_double(std::string_view text) {
    std::string copy(text);
    return std::strtod(copy.c_str(), nullptr);
}

template<typename T>
T to_uint(std::string_view text) noexcept {
    T value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    auto cut = url.find_first_of("?#");
    auto path = url.substr(0, cut);
    if (path.size() < 5) return false;

    auto tail = path.substr(path.size() - 5);
    return std::equal(tail.begin(), tail.end(), ".m3u8", [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

std::map<std::string, std::string> HLSParser::parse_attributes(std::string_view text) {
    std::map<std::string, std::string> attrs;
    std::size_t pos = 0;

    while (pos < text.size()) {
        auto eq = text.find('=', pos);
        if (eq == std::string_view::npos) break;

        std::string key(trim(text.substr(pos, eq - pos)));
        pos = eq + 1;

        std::string value;
        if (pos < text.size() && text[pos] == '"') {
            auto close = text.find('"', pos + 1);
            if (close == std::string_view::npos) close = text.size();
            value = std::string(text.substr(pos + 1, close - pos - 1));
            pos = close + 1;
            auto comma = text.find(',', std::min(pos, text.size()));
            pos = comma == std::string_view::npos ? text.size() : comma + 1;
        } else {
            auto comma = text.find(',', pos);
            auto end = comma == std::string_view::npos ? text.size() : comma;
            value = std::string(trim(text.substr(pos, end - pos)));
            pos = comma == std::string_view::npos ? text.size() : comma + 1;
        }

        if (!key.empty()) {
            attrs[std::move(key)] = std::move(value);
        }
    }
    return attrs;
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content, std::string_view base_url) {
    HLSPlaylist playlist;

    // Tolerate a UTF-8 BOM before the header
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }
    if (!trim(content).starts_with(TAG_HEADER)) {
        return std::unexpected(make_error_code(core::FetchErrc::invalid_manifest));
    }

    double current_duration = 0.0;
    bool pending_variant = false;
    HLSVariant variant;

    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        auto line = trim(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty()) {
            continue;
        }

        if (line[0] == '#') {
            if (line.starts_with(TAG_TARGET_DURATION)) {
                playlist.target_duration = to_double(line.substr(TAG_TARGET_DURATION.size()));
            } else if (line.starts_with(TAG_EXTINF)) {
                auto val = line.substr(TAG_EXTINF.size());
                auto comma_pos = val.find(',');
                if (comma_pos != std::string_view::npos) {
                    val = val.substr(0, comma_pos);
                }
                current_duration = to_double(val);
            } else if (line.starts_with(TAG_STREAM_INF)) {
                // Variant playlist; the URI is on the next line
                auto attrs = parse_attributes(line.substr(TAG_STREAM_INF.size()));
                variant = HLSVariant{};
                variant.bandwidth = to_uint<std::uint64_t>(attrs["BANDWIDTH"]);
                variant.codecs = attrs["CODECS"];
                const auto& res = attrs["RESOLUTION"];
                auto x = res.find('x');
                if (x != std::string::npos) {
                    variant.width = to_uint<std::uint32_t>(std::string_view(res).substr(0, x));
                    variant.height = to_uint<std::uint32_t>(std::string_view(res).substr(x + 1));
                }
                pending_variant = true;
            } else if (line.starts_with(TAG_MEDIA)) {
                auto attrs = parse_attributes(line.substr(TAG_MEDIA.size()));
                if (attrs["TYPE"] == "SUBTITLES" && !attrs["URI"].empty()) {
                    HLSSubtitle sub;
                    sub.language = attrs["LANGUAGE"];
                    sub.name = attrs["NAME"];
                    sub.url = core::Url::resolve(base_url, attrs["URI"]);
                    playlist.subtitles.push_back(std::move(sub));
                }
            } else if (line == TAG_ENDLIST) {
                playlist.has_endlist = true;
            }
            continue;
        }

        // URI line
        if (pending_variant) {
            variant.url = core::Url::resolve(base_url, line);
            playlist.variants.push_back(std::move(variant));
            variant = HLSVariant{};
            pending_variant = false;
        } else {
            HLSSegment segment;
            segment.url = core::Url::resolve(base_url, line);
            segment.duration = current_duration;
            playlist.total_duration += current_duration;
            playlist.segments.push_back(std::move(segment));
            current_duration = 0.0;
        }
    }

    return playlist;
}

const HLSVariant* select_variant(const std::vector<HLSVariant>& variants, std::uint32_t quality) noexcept {
    if (variants.empty()) {
        return nullptr;
    }
    if (quality > 0) {
        return quality <= variants.size() ? &variants[quality - 1] : nullptr;
    }
    return &*std::max_element(variants.begin(), variants.end(),
                              [](const HLSVariant& a, const HLSVariant& b) {
                                  return a.bandwidth < b.bandwidth;
                              });
}

} // namespace reel::media
