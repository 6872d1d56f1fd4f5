// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/media_downloader.hpp>
#include <reel/core/fetcher.hpp>
#include <reel/core/orchestrator.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/media/dash_parser.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <format>

namespace reel::media {

namespace {

StageError fetch_error(std::error_code ec) {
    return StageError{Stage::fetch, 0, ec, {}};
}

} // namespace

MediaKind detect_kind(std::string_view url) noexcept {
    if (DASHParser::is_dash_url(url)) {
        return MediaKind::dash;
    }
    if (HLSParser::is_hls_url(url)) {
        return MediaKind::hls;
    }
    return MediaKind::direct;
}

MediaKind kind_from_content_type(std::string_view content_type) noexcept {
    std::string type;
    for (char c : content_type.substr(0, content_type.find(';'))) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            type += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (type == "application/dash+xml") {
        return MediaKind::dash;
    }
    if (type == "application/vnd.apple.mpegurl" || type == "application/x-mpegurl"
        || type == "audio/mpegurl" || type == "audio/x-mpegurl") {
        return MediaKind::hls;
    }
    return MediaKind::direct;
}

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::fetch:         return "fetch";
        case Stage::orchestration: return "orchestration";
        case Stage::assembly:      return "assembly";
    }
    return "unknown";
}

std::string StageError::message() const {
    std::string text(to_string(stage));
    text += " failed";
    if (index > 0) {
        text += std::format(" at segment {}", index);
    }
    text += ": ";
    text += error.message();
    if (cause && cause != error) {
        text += std::format(" ({})", cause.message());
    }
    return text;
}

std::string guess_extension(std::string_view url_extension, std::string_view content_type) {
    if (!url_extension.empty()) {
        return std::string(url_extension);
    }
    if (content_type.find("video") != std::string_view::npos) {
        if (content_type.find("mp4") != std::string_view::npos) return ".mp4";
        if (content_type.find("mpeg") != std::string_view::npos) return ".mpeg";
        if (content_type.find("ts") != std::string_view::npos) return ".ts";
        if (content_type.find("webm") != std::string_view::npos) return ".webm";
        if (content_type.find("ogg") != std::string_view::npos) return ".ogg";
    }
    return ".bin";
}

//=============================================================================
// MediaDownloader
//=============================================================================

MediaDownloader::MediaDownloader(core::HttpTransport& transport, core::EngineConfig config, Muxer& muxer)
    : transport_(transport)
    , config_(std::move(config))
    , muxer_(muxer) {}

MediaResult MediaDownloader::download(const MediaRequest& request) {
    auto kind = detect_kind(request.url);
    std::string content_type;

    // Manifests behind URLs without a telling extension
    if (kind == MediaKind::direct) {
        content_type = probe_content_type(request.url);
        kind = kind_from_content_type(content_type);
        if (kind != MediaKind::direct) {
            spdlog::info("{} is served as {}", request.url, content_type);
        }
    }

    switch (kind) {
        case MediaKind::hls:    return download_hls(request);
        case MediaKind::dash:   return download_dash(request);
        case MediaKind::direct: return save_direct(request, content_type);
    }
    return std::unexpected(fetch_error(make_error_code(core::FetchErrc::invalid_url)));
}

std::string MediaDownloader::probe_content_type(const std::string& url) {
    auto head = transport_.head(url, core::RequestOptions::from(config_));
    if (!head) {
        spdlog::debug("HEAD {} failed: {}", url, head.error().message());
        return {};
    }
    if (head->status_code < 200 || head->status_code >= 300) {
        spdlog::debug("HEAD {} answered {}", url, head->status_code);
        return {};
    }
    return head->content_type;
}

std::string MediaDownloader::output_name(const MediaRequest& request) const {
    if (!request.name.empty()) {
        return request.name;
    }
    auto url = core::Url::parse(request.url);
    return url ? url->stem() : std::string("output");
}

std::expected<std::string, std::error_code> MediaDownloader::fetch_manifest(const std::string& url) {
    spdlog::info("Loading manifest {}", url);
    return core::fetch_text(transport_, url, core::RequestOptions::from(config_));
}

MediaResult MediaDownloader::download_hls(const MediaRequest& request) {
    auto text = fetch_manifest(request.url);
    if (!text) {
        return std::unexpected(fetch_error(text.error()));
    }

    auto playlist = HLSParser::parse(*text, request.url);
    if (!playlist) {
        return std::unexpected(fetch_error(playlist.error()));
    }

    if (playlist->is_master()) {
        if (request.subtitles) {
            download_subtitles(playlist->subtitles, request.directory);
        }

        spdlog::info("Available qualities:");
        for (std::size_t i = 0; i < playlist->variants.size(); ++i) {
            const auto& v = playlist->variants[i];
            spdlog::info("  {}: {} bps{}", i + 1, v.bandwidth,
                         v.width > 0 ? std::format(", {}x{}", v.width, v.height) : std::string{});
        }

        const auto* variant = select_variant(playlist->variants, request.quality);
        if (!variant && request.quality > 0) {
            spdlog::warn("Quality {} is not one of the {} variants, using the highest bandwidth",
                         request.quality, playlist->variants.size());
            variant = select_variant(playlist->variants, 0);
        }
        if (!variant) {
            return std::unexpected(fetch_error(make_error_code(core::FetchErrc::invalid_manifest)));
        }

        spdlog::info("Selected variant {} bps{}", variant->bandwidth,
                     variant->width > 0 ? std::format(", {}x{}", variant->width, variant->height)
                                        : std::string{});

        std::string variant_url = variant->url;
        text = fetch_manifest(variant_url);
        if (!text) {
            return std::unexpected(fetch_error(text.error()));
        }
        playlist = HLSParser::parse(*text, variant_url);
        if (!playlist) {
            return std::unexpected(fetch_error(playlist.error()));
        }
    } else if (request.subtitles && !playlist->subtitles.empty()) {
        download_subtitles(playlist->subtitles, request.directory);
    }

    if (playlist->segments.empty()) {
        return std::unexpected(fetch_error(make_error_code(core::FetchErrc::invalid_manifest)));
    }

    std::vector<std::string> urls;
    urls.reserve(playlist->segments.size());
    for (const auto& segment : playlist->segments) {
        urls.push_back(segment.url);
    }
    return run_segments(urls, request.directory, output_name(request));
}

MediaResult MediaDownloader::download_dash(const MediaRequest& request) {
    auto text = fetch_manifest(request.url);
    if (!text) {
        return std::unexpected(fetch_error(text.error()));
    }

    auto manifest = DASHParser::parse(*text, request.url);
    if (!manifest) {
        return std::unexpected(fetch_error(manifest.error()));
    }

    auto urls = DASHParser::segment_urls(*manifest);
    if (!urls) {
        spdlog::error("No segment list could be derived from {}", request.url);
        return std::unexpected(fetch_error(urls.error()));
    }
    return run_segments(*urls, request.directory, output_name(request));
}

MediaResult MediaDownloader::download_direct(const MediaRequest& request) {
    auto url = core::Url::parse(request.url);
    if (!url) {
        return std::unexpected(fetch_error(url.error()));
    }

    std::string content_type;
    if (url->extension().empty()) {
        content_type = probe_content_type(request.url);
    }
    return save_direct(request, content_type);
}

MediaResult MediaDownloader::save_direct(const MediaRequest& request, const std::string& content_type) {
    auto url = core::Url::parse(request.url);
    if (!url) {
        return std::unexpected(fetch_error(url.error()));
    }

    if (auto ec = disk::ensure_directory(request.directory)) {
        return std::unexpected(fetch_error(ec));
    }

    auto extension = url->extension();

    // A leftover part file keeps its name so the transfer resumes
    auto path = next_available_name(request.directory, output_name(request),
                                    guess_extension(extension, content_type));

    spdlog::info("Downloading {} to {}", request.url, path);

    core::Fetcher fetcher(transport_, config_, stop_.get_token());
    if (callback_) {
        fetcher.callback([this](std::uint64_t bytes, std::uint64_t total) {
            callback_(MediaProgress{bytes, total, true});
        });
    }

    auto fetched = fetcher.fetch(request.url, path);
    if (!fetched) {
        return std::unexpected(StageError{Stage::fetch, 0, fetched.error(), fetcher.state().last_error});
    }

    spdlog::info("Saved {} ({} bytes)", path, *fetched);
    return path;
}

std::vector<std::string> MediaDownloader::download_subtitles(const std::vector<HLSSubtitle>& subtitles,
                                                             const std::string& directory) {
    std::vector<std::string> saved;
    if (subtitles.empty()) {
        spdlog::info("No subtitles found");
        return saved;
    }

    if (auto ec = disk::ensure_directory(directory)) {
        spdlog::warn("Skipping subtitles: {}", ec.message());
        return saved;
    }

    spdlog::info("Found {} subtitle track(s)", subtitles.size());

    for (std::size_t i = 0; i < subtitles.size(); ++i) {
        const auto& sub = subtitles[i];
        auto lang = sub.language.empty() ? std::format("sub{}", i + 1) : sub.language;

        std::string extension = ".vtt";
        if (auto url = core::Url::parse(sub.url); url && !url->extension().empty()) {
            extension = url->extension();
        }

        auto path = next_available_name(directory, "subtitle_" + lang, extension);

        core::Fetcher fetcher(transport_, config_, stop_.get_token());
        fetcher.label("subtitle " + lang);
        auto fetched = fetcher.fetch(sub.url, path);
        if (!fetched) {
            spdlog::warn("Subtitle '{}' failed: {}", lang, fetched.error().message());
            continue;
        }

        spdlog::info("Saved subtitle '{}' as {}", lang, path);
        saved.push_back(std::move(path));
    }
    return saved;
}

MediaResult MediaDownloader::run_segments(const std::vector<std::string>& urls,
                                          const std::string& directory, const std::string& name) {
    std::vector<core::SegmentSpec> specs;
    specs.reserve(urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i) {
        specs.push_back(core::SegmentSpec{static_cast<std::uint32_t>(i + 1), urls[i]});
    }

    core::Orchestrator orchestrator(transport_, config_);
    if (callback_) {
        orchestrator.callback([this](const core::JobProgress& p) {
            callback_(MediaProgress{p.completed, p.total, false});
        });
    }

    // cancel() reaches the running job
    std::stop_callback link(stop_.get_token(), [&orchestrator] { orchestrator.cancel(); });

    auto outcome = orchestrator.run(specs, directory);
    if (!outcome) {
        const auto& failure = outcome.error();
        return std::unexpected(StageError{Stage::orchestration, failure.index, failure.error, failure.cause});
    }

    Assembler assembler(muxer_, directory, name);
    auto output = next_available_name(directory, name, ".mp4");
    auto merged = assembler.assemble(*outcome, output);
    if (!merged) {
        return std::unexpected(StageError{Stage::assembly, 0, merged.error(), {}});
    }

    spdlog::info("Saved merged video as {}", *merged);
    return *merged;
}

} // namespace reel::media
