// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace reel::cli {

// Process exit status
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir{"downloads"};
    std::string name;
    std::string config_file;
    std::optional<std::uint32_t> parallel;
    std::optional<std::uint32_t> retries;
    std::optional<double> backoff;
    std::uint32_t quality{0};
    bool subtitles{true};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;              // Usage error, empty when the line parsed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) with flag overrides applied, validated
[[nodiscard]] std::expected<core::EngineConfig, std::error_code> build_config(const CliArgs& args) noexcept;

// Download args.url; returns the process exit status
[[nodiscard]] int download(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
