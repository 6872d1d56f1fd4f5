// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/http_session.hpp>
#include <reel/media/assembler.hpp>
#include <reel/media/media_downloader.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace reel::cli {

namespace {

bool parse_count(std::string_view text, std::uint32_t& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse_seconds(const char* text, double& out) noexcept {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value = [&](int& i, std::string_view flag) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = std::string(flag) + " needs a value";
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--no-subtitles") {
            args.subtitles = false;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value(i, arg)) args.output_dir = v;
        } else if (arg == "-o" || arg == "--name") {
            if (auto v = value(i, arg)) args.name = v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) args.config_file = v;
        } else if (arg == "-p" || arg == "--parallel") {
            if (auto v = value(i, arg)) {
                std::uint32_t n = 0;
                if (!parse_count(v, n)) {
                    args.error = "invalid worker count: " + std::string(v);
                } else {
                    args.parallel = n;
                }
            }
        } else if (arg == "-r" || arg == "--retries") {
            if (auto v = value(i, arg)) {
                std::uint32_t n = 0;
                if (!parse_count(v, n)) {
                    args.error = "invalid retry count: " + std::string(v);
                } else {
                    args.retries = n;
                }
            }
        } else if (arg == "-b" || arg == "--backoff") {
            if (auto v = value(i, arg)) {
                double seconds = 0;
                if (!parse_seconds(v, seconds)) {
                    args.error = "invalid backoff: " + std::string(v);
                } else {
                    args.backoff = seconds;
                }
            }
        } else if (arg == "-q" || arg == "--quality") {
            if (auto v = value(i, arg)) {
                if (!parse_count(v, args.quality)) {
                    args.error = "invalid quality: " + std::string(v);
                }
            }
        } else if (arg.starts_with("-")) {
            args.error = "unknown option: " + arg;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "unexpected argument: " + arg;
        }
    }

    if (args.error.empty() && args.url.empty()) {
        args.error = "no URL specified";
    }
    return args;
}

std::expected<core::EngineConfig, std::error_code> build_config(const CliArgs& args) noexcept {
    core::EngineConfig config;
    if (!args.config_file.empty()) {
        auto loaded = core::load_config(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.parallel) config.worker_count = *args.parallel;
    if (args.retries) config.max_attempts = *args.retries;
    if (args.backoff) config.backoff_base = *args.backoff;

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args) noexcept {
    try {
        auto config = build_config(args);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return EXIT_USAGE;
        }

        spdlog::debug("Workers: {}, attempts: {}, backoff base: {}s", config->worker_count,
                      config->max_attempts, config->backoff_base);

        core::HttpSession session;
        media::FfmpegMuxer muxer(config->muxer_program);
        media::MediaDownloader downloader(session, *config, muxer);

        std::unique_ptr<ProgressBar> bar;
        if (!args.quiet) {
            bar = std::make_unique<ProgressBar>(0, "Downloading");
            downloader.callback([&bar](const media::MediaProgress& p) {
                bar->unit(p.bytes ? ProgressBar::Unit::bytes : ProgressBar::Unit::items);
                bar->label(p.bytes ? "Downloading" : "Segments");
                bar->total(p.total);
                bar->update(p.completed);
            });
        }

        media::MediaRequest request;
        request.url = args.url;
        request.directory = args.output_dir;
        request.name = args.name;
        request.quality = args.quality;
        request.subtitles = args.subtitles;

        auto result = downloader.download(request);
        if (bar) {
            if (result) {
                bar->finish();
            } else {
                bar->clear();
            }
        }

        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            return EXIT_FAILED;
        }

        if (!args.quiet) {
            std::cout << "Saved " << *result << std::endl;
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel - Segmented Media Fetcher v" << reel::version.to_string() << "\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] <URL>\n\n";
    std::cout << "Fetches an HLS (.m3u8) or DASH (.mpd) stream and merges it into one\n";
    std::cout << "file with ffmpeg, or downloads a plain file with resume.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --directory <DIR>     Output directory (default: downloads)\n";
    std::cout << "  -o, --name <NAME>         Output base name (default: from URL)\n";
    std::cout << "  -p, --parallel <N>        Concurrent segment downloads (default: "
              << core::DEFAULT_WORKER_COUNT << ")\n";
    std::cout << "  -r, --retries <N>         Attempts per segment (default: "
              << core::DEFAULT_MAX_ATTEMPTS << ")\n";
    std::cout << "  -b, --backoff <SECONDS>   Backoff base, raised to the attempt (default: "
              << core::DEFAULT_BACKOFF_BASE << ")\n";
    std::cout << "  -c, --config <FILE>       JSON configuration file\n";
    std::cout << "  -q, --quality <N>         HLS variant, 1-based (default: highest bandwidth)\n";
    std::cout << "      --no-subtitles        Skip HLS subtitle tracks\n";
    std::cout << "  -V, --verbose             Verbose output\n";
    std::cout << "      --quiet               Warnings and errors only\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n\n";
    std::cout << "Exit status: 0 success, 1 download failed, 2 usage error\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " https://example.com/stream/master.m3u8\n";
    std::cout << "  " << program_name << " -p 8 -o movie https://example.com/manifest.mpd\n";
    std::cout << "  " << program_name << " -d ~/Videos https://example.com/clip.mp4\n";
}

void print_version() noexcept {
    std::cout << "Reel v" << reel::version.to_string() << "\n";
    std::cout << "Built: " << reel::BUILD_DATE << "\n";
}

} // namespace reel::cli
