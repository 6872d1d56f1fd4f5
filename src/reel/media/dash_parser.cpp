// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/dash_parser.hpp>
#include <reel/core/error.hpp>
#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>
#include <map>

namespace reel::media {

namespace {

using Attributes = std::map<std::string, std::string, std::less<>>;

// One start, end or empty-element tag
struct Tag {
    std::string name;               // Local name, namespace prefix dropped
    Attributes attrs;
    bool closing{false};
    bool self_closing{false};
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string decode_entities(std::string_view text) {
    static constexpr std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '&') {
            bool matched = false;
            for (const auto& [entity, ch] : entities) {
                if (text.substr(i).starts_with(entity)) {
                    out += ch;
                    i += entity.size() - 1;
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }
        out += text[i];
    }
    return out;
}

std::string local_name(std::string_view name) {
    auto colon = name.find(':');
    return std::string(colon == std::string_view::npos ? name : name.substr(colon + 1));
}

void parse_tag_attributes(std::string_view text, Attributes& attrs) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        auto eq = text.find('=', pos);
        if (eq == std::string_view::npos) break;

        auto name = local_name(trim(text.substr(pos, eq - pos)));
        pos = eq + 1;
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size()) break;

        char quote = text[pos];
        if (quote != '"' && quote != '\'') break;
        auto close = text.find(quote, pos + 1);
        if (close == std::string_view::npos) break;

        attrs[name] = decode_entities(text.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
}

// Next tag at or after pos; comments, declarations and processing
// instructions are skipped. pos ends just past the tag's '>'.
std::optional<Tag> next_tag(std::string_view content, std::size_t& pos) {
    while (true) {
        auto lt = content.find('<', pos);
        if (lt == std::string_view::npos) return std::nullopt;

        auto rest = content.substr(lt);
        if (rest.starts_with("<!--")) {
            auto end = content.find("-->", lt + 4);
            pos = end == std::string_view::npos ? content.size() : end + 3;
            continue;
        }
        if (rest.starts_with("<?") || rest.starts_with("<!")) {
            auto end = content.find('>', lt);
            pos = end == std::string_view::npos ? content.size() : end + 1;
            continue;
        }

        // Find the closing '>' outside quoted attribute values
        char quote = 0;
        std::size_t gt = lt + 1;
        for (; gt < content.size(); ++gt) {
            char c = content[gt];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (gt >= content.size()) return std::nullopt;

        auto inner = content.substr(lt + 1, gt - lt - 1);
        pos = gt + 1;

        Tag tag;
        if (inner.starts_with('/')) {
            tag.closing = true;
            inner.remove_prefix(1);
        }
        inner = trim(inner);
        if (inner.ends_with('/')) {
            tag.self_closing = true;
            inner.remove_suffix(1);
        }

        auto name_end = std::find_if(inner.begin(), inner.end(),
                                     [](unsigned char c) { return std::isspace(c); });
        auto name_len = static_cast<std::size_t>(name_end - inner.begin());
        tag.name = local_name(inner.substr(0, name_len));
        parse_tag_attributes(inner.substr(name_len), tag.attrs);
        return tag;
    }
}

std::string attr(const Attributes& attrs, std::string_view key) {
    auto it = attrs.find(key);
    return it == attrs.end() ? std::string{} : it->second;
}

template<typename T>
std::optional<T> attr_uint(const Attributes& attrs, std::string_view key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    T value = 0;
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{}) return std::nullopt;
    return value;
}

void apply_template(DASHSegmentTemplate& t, const Attributes& attrs) {
    t.present = true;
    if (attrs.contains("media")) t.media = attr(attrs, "media");
    if (attrs.contains("initialization")) t.initialization = attr(attrs, "initialization");
    if (auto v = attr_uint<std::uint64_t>(attrs, "timescale"); v && *v > 0) t.timescale = *v;
    if (auto v = attr_uint<std::uint64_t>(attrs, "duration")) t.duration = *v;
    if (auto v = attr_uint<std::uint64_t>(attrs, "startNumber")) t.start_number = *v;
}

// Fill initialization_url and segment_urls from the template
void build_segment_urls(DASHRepresentation& rep, double duration_sec) {
    const auto& t = rep.segment_template;
    if (!t.present || t.media.empty()) {
        return;
    }

    if (!t.initialization.empty()) {
        rep.initialization_url = core::Url::resolve(
            rep.base_url, expand_template(t.initialization, rep.id, rep.bandwidth, t.start_number, 0));
    }

    auto add = [&rep, &t](std::uint64_t number, std::uint64_t time) {
        rep.segment_urls.push_back(core::Url::resolve(
            rep.base_url, expand_template(t.media, rep.id, rep.bandwidth, number, time)));
    };

    if (!t.timeline.empty()) {
        std::uint64_t number = t.start_number;
        const auto period_end = duration_sec > 0
            ? static_cast<std::uint64_t>(std::llround(duration_sec * static_cast<double>(t.timescale)))
            : 0;
        std::uint64_t time = 0;

        for (std::size_t i = 0; i < t.timeline.size(); ++i) {
            const auto& s = t.timeline[i];
            if (s.time) time = *s.time;
            if (s.duration == 0) continue;

            std::int64_t repeats = s.repeat;
            if (repeats < 0) {
                // Open-ended: up to the next explicit start or the period end
                std::uint64_t end = period_end;
                if (i + 1 < t.timeline.size() && t.timeline[i + 1].time) {
                    end = *t.timeline[i + 1].time;
                }
                if (end <= time) {
                    rep.segment_urls.clear();
                    return;
                }
                repeats = static_cast<std::int64_t>((end - time + s.duration - 1) / s.duration) - 1;
            }

            if (static_cast<std::uint64_t>(repeats) >= MAX_DASH_SEGMENTS - rep.segment_urls.size()) {
                rep.segment_urls.clear();
                return;
            }

            for (std::int64_t k = 0; k <= repeats; ++k) {
                add(number++, time);
                time += s.duration;
            }
        }
        rep.count_known = true;
        return;
    }

    if (t.duration > 0 && duration_sec > 0) {
        const std::uint64_t number = t.start_number;
        double exact = duration_sec * static_cast<double>(t.timescale) / static_cast<double>(t.duration);
        if (!(exact <= static_cast<double>(MAX_DASH_SEGMENTS))) {
            return;
        }
        auto count = static_cast<std::uint64_t>(std::ceil(exact - 1e-9));
        for (std::uint64_t k = 0; k < count; ++k) {
            add(number + k, k * t.duration);
        }
        rep.count_known = true;
    }
}

} // namespace

std::optional<double> parse_iso8601_duration(std::string_view text) noexcept {
    text = trim(text);
    if (!text.starts_with('P')) return std::nullopt;
    text.remove_prefix(1);

    bool in_time = false;
    bool any = false;
    double total = 0.0;

    while (!text.empty()) {
        if (text.front() == 'T') {
            in_time = true;
            text.remove_prefix(1);
            continue;
        }

        std::size_t i = 0;
        while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) ++i;
        if (i == 0 || i == text.size()) return std::nullopt;

        char buf[64];
        if (i >= sizeof(buf)) return std::nullopt;
        std::copy_n(text.data(), i, buf);
        buf[i] = '\0';
        char* end = nullptr;
        double value = std::strtod(buf, &end);
        if (end != buf + i) return std::nullopt;

        char unit = text[i];
        text.remove_prefix(i + 1);

        double scale = 0.0;
        switch (unit) {
            case 'Y': scale = in_time ? 0.0 : 365.0 * 86400.0; break;
            case 'M': scale = in_time ? 60.0 : 30.0 * 86400.0; break;
            case 'W': scale = in_time ? 0.0 : 7.0 * 86400.0; break;
            case 'D': scale = in_time ? 0.0 : 86400.0; break;
            case 'H': scale = in_time ? 3600.0 : 0.0; break;
            case 'S': scale = in_time ? 1.0 : 0.0; break;
            default: return std::nullopt;
        }
        if (scale == 0.0) return std::nullopt;

        total += value * scale;
        any = true;
    }

    if (!any) return std::nullopt;
    return total;
}

std::string expand_template(std::string_view pattern, std::string_view representation_id,
                            std::uint64_t bandwidth, std::uint64_t number, std::uint64_t time) {
    std::string out;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        auto open = pattern.find('$', pos);
        if (open == std::string_view::npos) {
            out += pattern.substr(pos);
            break;
        }
        out += pattern.substr(pos, open - pos);

        auto close = pattern.find('$', open + 1);
        if (close == std::string_view::npos) {
            out += pattern.substr(open);
            break;
        }
        auto token = pattern.substr(open + 1, close - open - 1);
        pos = close + 1;

        if (token.empty()) {
            out += '$';
            continue;
        }
        if (token == "RepresentationID") {
            out += representation_id;
            continue;
        }

        auto pct = token.find('%');
        auto ident = token.substr(0, pct);
        std::uint64_t value = 0;
        if (ident == "Number") {
            value = number;
        } else if (ident == "Bandwidth") {
            value = bandwidth;
        } else if (ident == "Time") {
            value = time;
        } else {
            // Unknown identifier stays as written
            out += pattern.substr(open, close - open + 1);
            continue;
        }

        int width = 0;
        if (pct != std::string_view::npos) {
            auto spec = token.substr(pct + 1);
            if (spec.ends_with('d')) spec.remove_suffix(1);
            std::from_chars(spec.data(), spec.data() + spec.size(), width);
        }

        if (width > 0) {
            out += std::format("{:0{}}", value, width);
        } else {
            out += std::to_string(value);
        }
    }
    return out;
}

bool DASHParser::is_dash_url(std::string_view url) noexcept {
    auto cut = url.find_first_of("?#");
    auto path = url.substr(0, cut);
    if (path.size() < 4) return false;

    auto tail = path.substr(path.size() - 4);
    return std::equal(tail.begin(), tail.end(), ".mpd", [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

std::expected<DASHManifest, std::error_code>
DASHParser::parse(std::string_view content, std::string_view base_url) {
    DASHManifest manifest;

    bool seen_mpd = false;
    bool period_duration_used = false;
    bool in_period = false;
    bool in_set = false;
    bool in_rep = false;

    std::string mpd_base(base_url);
    std::string period_base;
    std::string set_base;

    DASHAdaptationSet set;
    DASHSegmentTemplate set_template;
    DASHRepresentation rep;
    DASHSegmentTemplate* open_template = nullptr;

    auto finish_rep = [&] {
        set.representations.push_back(std::move(rep));
        rep = DASHRepresentation{};
        in_rep = false;
    };

    std::size_t pos = 0;
    while (auto tag = next_tag(content, pos)) {
        const auto& name = tag->name;

        if (tag->closing) {
            if (name == "SegmentTemplate") {
                open_template = nullptr;
            } else if (name == "Representation" && in_rep) {
                finish_rep();
            } else if (name == "AdaptationSet" && in_set) {
                manifest.adaptation_sets.push_back(std::move(set));
                set = DASHAdaptationSet{};
                set_template = DASHSegmentTemplate{};
                in_set = false;
            } else if (name == "Period") {
                in_period = false;
            }
            continue;
        }

        if (name == "MPD") {
            seen_mpd = true;
            manifest.is_live = attr(tag->attrs, "type") == "dynamic";
            if (auto d = parse_iso8601_duration(attr(tag->attrs, "mediaPresentationDuration"))) {
                manifest.duration_sec = *d;
            }
            if (auto d = parse_iso8601_duration(attr(tag->attrs, "minBufferTime"))) {
                manifest.min_buffer_time = *d;
            }
        } else if (name == "Period") {
            in_period = !tag->self_closing;
            period_base = mpd_base;
            if (manifest.duration_sec <= 0 && !period_duration_used) {
                if (auto d = parse_iso8601_duration(attr(tag->attrs, "duration"))) {
                    manifest.duration_sec = *d;
                    period_duration_used = true;
                }
            }
        } else if (name == "BaseURL" && !tag->self_closing) {
            auto end = content.find('<', pos);
            auto text = decode_entities(trim(content.substr(pos, end - pos)));
            if (in_rep) {
                rep.base_url = core::Url::resolve(rep.base_url, text);
            } else if (in_set) {
                set_base = core::Url::resolve(set_base, text);
            } else if (in_period) {
                period_base = core::Url::resolve(period_base, text);
            } else {
                mpd_base = core::Url::resolve(mpd_base, text);
            }
        } else if (name == "AdaptationSet") {
            set = DASHAdaptationSet{};
            set_template = DASHSegmentTemplate{};
            set.id = attr(tag->attrs, "id");
            set.mime_type = attr(tag->attrs, "mimeType");
            set.content_type = attr(tag->attrs, "contentType");
            set_base = in_period ? period_base : mpd_base;
            in_set = !tag->self_closing;
            if (tag->self_closing) {
                manifest.adaptation_sets.push_back(std::move(set));
                set = DASHAdaptationSet{};
            }
        } else if (name == "Representation") {
            rep = DASHRepresentation{};
            rep.id = attr(tag->attrs, "id");
            rep.bandwidth = attr_uint<std::uint64_t>(tag->attrs, "bandwidth").value_or(0);
            rep.mime_type = tag->attrs.contains("mimeType") ? attr(tag->attrs, "mimeType") : set.mime_type;
            rep.codecs = attr(tag->attrs, "codecs");
            rep.width = attr_uint<std::uint32_t>(tag->attrs, "width").value_or(0);
            rep.height = attr_uint<std::uint32_t>(tag->attrs, "height").value_or(0);
            rep.base_url = in_set ? set_base : (in_period ? period_base : mpd_base);
            rep.segment_template = set_template;
            in_rep = true;
            if (tag->self_closing) {
                finish_rep();
            }
        } else if (name == "SegmentTemplate") {
            DASHSegmentTemplate& target = in_rep ? rep.segment_template : set_template;
            apply_template(target, tag->attrs);
            open_template = tag->self_closing ? nullptr : &target;
        } else if (name == "SegmentTimeline" && open_template) {
            open_template->timeline.clear();
        } else if (name == "S" && open_template) {
            DASHTimelineEntry entry;
            entry.time = attr_uint<std::uint64_t>(tag->attrs, "t");
            entry.duration = attr_uint<std::uint64_t>(tag->attrs, "d").value_or(0);
            entry.repeat = attr_uint<std::int64_t>(tag->attrs, "r").value_or(0);
            open_template->timeline.push_back(entry);
        }
    }

    if (!seen_mpd) {
        return std::unexpected(make_error_code(core::FetchErrc::invalid_manifest));
    }

    // Segment lists need the presentation duration, known only now
    for (auto& s : manifest.adaptation_sets) {
        for (auto& r : s.representations) {
            build_segment_urls(r, manifest.duration_sec);
        }
    }
    return manifest;
}

std::expected<std::vector<std::string>, std::error_code>
DASHParser::segment_urls(const DASHManifest& manifest) {
    for (const auto& set : manifest.adaptation_sets) {
        for (const auto& rep : set.representations) {
            if (!rep.segment_template.present || rep.segment_template.media.empty()) {
                continue;
            }
            if (!rep.count_known) {
                return std::unexpected(make_error_code(core::FetchErrc::invalid_manifest));
            }

            std::vector<std::string> urls;
            urls.reserve(rep.segment_urls.size() + 1);
            if (!rep.initialization_url.empty()) {
                urls.push_back(rep.initialization_url);
            }
            urls.insert(urls.end(), rep.segment_urls.begin(), rep.segment_urls.end());
            return urls;
        }
    }
    return std::unexpected(make_error_code(core::FetchErrc::invalid_manifest));
}

} // namespace reel::media
