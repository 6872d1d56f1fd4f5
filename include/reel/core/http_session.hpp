// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reel::core {

// HTTP response head
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;    // Lowercase names
    std::optional<std::uint64_t> content_length;   // Absent for chunked bodies
    bool accepts_ranges{false};
    std::string content_type;
    std::string content_range;
};

// Per-request knobs
struct RequestOptions {
    std::uint64_t offset{0};                       // Sends "Range: bytes=<offset>-" when > 0
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_timeout_sec{LOW_SPEED_TIMEOUT_SEC};
    std::size_t buffer_size{DEFAULT_CHUNK_SIZE};
    std::string user_agent{DEFAULT_USER_AGENT};

    [[nodiscard]] static RequestOptions from(const EngineConfig& cfg, std::uint64_t offset = 0);
};

// Receives the response head exactly once, then the body in chunks.
// An error returned from either callback aborts the transfer and is
// what get() reports.
struct BodyHandler {
    std::function<std::error_code(const HttpResponse&)> on_response;
    std::function<std::error_code(const char* data, std::size_t size)> on_data;
};

// Transport seam between the Fetcher and the network.
// Status codes are reported, never turned into errors here.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url, const RequestOptions& options) = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url, const RequestOptions& options, const BodyHandler& handler) = 0;
};

// GET a small text body (manifests, subtitles) into memory.
// Non-2xx becomes http_status.
[[nodiscard]] std::expected<std::string, std::error_code>
fetch_text(HttpTransport& transport, const std::string& url, const RequestOptions& options,
           std::size_t max_size = 64 * 1024 * 1024);

// libcurl transport; one easy handle per request so workers never share state
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, const RequestOptions& options) override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url, const RequestOptions& options, const BodyHandler& handler) override;

    // Global initialization (call once at startup, before any worker runs)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Total from "bytes 0-99/1234" or "bytes */1234"
[[nodiscard]] std::optional<std::uint64_t> content_range_total(std::string_view value) noexcept;

// First byte from "bytes 100-199/1234"
[[nodiscard]] std::optional<std::uint64_t> content_range_start(std::string_view value) noexcept;

// Fill content_length, accepts_ranges, content_type and content_range from headers
void apply_headers(HttpResponse& response) noexcept;

} // namespace reel::core
