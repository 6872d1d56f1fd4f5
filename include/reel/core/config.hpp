// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

constexpr std::uint32_t DEFAULT_MAX_ATTEMPTS = 5;
constexpr double DEFAULT_BACKOFF_BASE = 2.0;                  // seconds, raised to the attempt number
constexpr std::uint32_t DEFAULT_WORKER_COUNT = 4;
constexpr std::uint32_t MAX_WORKER_COUNT = 256;
constexpr double MAX_BACKOFF_SEC = 300.0;                     // Longest single wait between attempts

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t LOW_SPEED_TIMEOUT_SEC = 15;           // Below 1 B/s for this long = timeout

constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;         // 64 KB
constexpr std::size_t MAX_CHUNK_SIZE = 10 * 1024 * 1024;      // libcurl's receive buffer limit

constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::string_view DEFAULT_USER_AGENT = "Mozilla/5.0";
constexpr std::string_view DEFAULT_SEGMENT_EXTENSION = ".ts";
constexpr std::string_view DEFAULT_MUXER_PROGRAM = "ffmpeg";

// Engine settings shared by every Fetcher and the Orchestrator of one run
struct EngineConfig {
    std::uint32_t max_attempts{DEFAULT_MAX_ATTEMPTS};
    double backoff_base{DEFAULT_BACKOFF_BASE};
    std::uint32_t worker_count{DEFAULT_WORKER_COUNT};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_timeout_sec{LOW_SPEED_TIMEOUT_SEC};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::string user_agent{DEFAULT_USER_AGENT};
    std::string segment_extension{DEFAULT_SEGMENT_EXTENSION};
    std::string muxer_program{DEFAULT_MUXER_PROGRAM};

    // Returns invalid_config when a value cannot drive a run
    [[nodiscard]] std::error_code validate() const noexcept;
};

// Parse a JSON object; missing keys keep their defaults
[[nodiscard]] std::expected<EngineConfig, std::error_code>
parse_config(std::string_view json_text, EngineConfig base = {}) noexcept;

// Read and parse a JSON configuration file
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_config(const std::string& path, EngineConfig base = {}) noexcept;

} // namespace reel::core
