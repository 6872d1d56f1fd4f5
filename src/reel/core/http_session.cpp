// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// State shared with the curl callbacks of one request
struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const BodyHandler* handler{nullptr};
    bool head_delivered{false};
    std::error_code handler_error;
};

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);

    // New status line: a redirect or 100-continue started a fresh header block
    if (header.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    ctx->response.headers[lower_name] = std::string(value);
    return total;
}

// Hand the response head to the handler once, before the first body byte
std::error_code deliver_head(TransferContext& ctx) {
    if (ctx.head_delivered) return {};
    ctx.head_delivered = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    apply_headers(ctx.response);

    if (ctx.handler && ctx.handler->on_response) {
        return ctx.handler->on_response(ctx.response);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return 0;

    std::size_t total = size * nmemb;

    if (auto ec = deliver_head(*ctx)) {
        ctx->handler_error = ec;
        return 0;  // Aborts with CURLE_WRITE_ERROR
    }

    if (ctx->handler && ctx->handler->on_data) {
        if (auto ec = ctx->handler->on_data(ptr, total)) {
            ctx->handler_error = ec;
            return 0;
        }
    }
    return total;
}

std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*) {
    return size * nitems;
}

std::error_code map_curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(FetchErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(FetchErrc::invalid_url);
        default:
            return make_error_code(FetchErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const RequestOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.low_speed_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required for multi-threaded use
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
}

} // namespace

//=============================================================================
// Helpers
//=============================================================================

RequestOptions RequestOptions::from(const EngineConfig& cfg, std::uint64_t offset) {
    RequestOptions options;
    options.offset = offset;
    options.connect_timeout_sec = cfg.connect_timeout_sec;
    options.low_speed_timeout_sec = cfg.low_speed_timeout_sec;
    options.buffer_size = cfg.chunk_size;
    options.user_agent = cfg.user_agent;
    return options;
}

std::optional<std::uint64_t> content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos) return std::nullopt;
    return parse_u64(value.substr(slash + 1));
}

std::optional<std::uint64_t> content_range_start(std::string_view value) noexcept {
    auto space = value.find(' ');
    auto dash = value.find('-');
    if (space == std::string_view::npos || dash == std::string_view::npos || dash < space) {
        return std::nullopt;
    }
    return parse_u64(value.substr(space + 1, dash - space - 1));
}

void apply_headers(HttpResponse& response) noexcept {
    const auto& headers = response.headers;

    auto cl_it = headers.find("content-length");
    response.content_length = cl_it != headers.end() ? parse_u64(cl_it->second) : std::nullopt;

    auto ct_it = headers.find("content-type");
    if (ct_it != headers.end()) response.content_type = ct_it->second;

    auto cr_it = headers.find("content-range");
    if (cr_it != headers.end()) response.content_range = cr_it->second;

    auto ar_it = headers.find("accept-ranges");
    response.accepts_ranges = ar_it != headers.end() && ar_it->second.find("bytes") != std::string::npos;
}

std::expected<std::string, std::error_code>
fetch_text(HttpTransport& transport, const std::string& url, const RequestOptions& options,
           std::size_t max_size) {
    std::string body;
    BodyHandler handler;
    handler.on_response = [&url](const HttpResponse& r) -> std::error_code {
        if (r.status_code < 200 || r.status_code >= 300) {
            spdlog::debug("GET {} answered {}", url, r.status_code);
            return make_error_code(FetchErrc::http_status);
        }
        return {};
    };
    handler.on_data = [&body, max_size](const char* data, std::size_t size) -> std::error_code {
        if (body.size() + size > max_size) {
            return make_error_code(FetchErrc::size_mismatch);
        }
        body.append(data, size);
        return {};
    };

    auto result = transport.get(url, options, handler);
    if (!result) {
        return std::unexpected(result.error());
    }
    return body;
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, const RequestOptions& options) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;

    apply_common_options(curl.ptr, url, options);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    apply_headers(ctx.response);
    return ctx.response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url, const RequestOptions& options, const BodyHandler& handler) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.handler = &handler;

    apply_common_options(curl.ptr, url, options);

    // Resume: open-ended range from the bytes already on disk
    std::string range;
    if (options.offset > 0) {
        range = std::to_string(options.offset) + "-";
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    const auto buffer_size = static_cast<long>(std::min(options.buffer_size, MAX_CHUNK_SIZE));
    if (curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, buffer_size) != CURLE_OK) {
        spdlog::debug("GET {}: buffer size {} rejected, keeping libcurl's default", url, buffer_size);
    }
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.handler_error) {
        return std::unexpected(ctx.handler_error);
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    // Empty bodies never reach write_callback
    if (auto ec = deliver_head(ctx)) {
        return std::unexpected(ec);
    }
    return ctx.response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace reel::core
