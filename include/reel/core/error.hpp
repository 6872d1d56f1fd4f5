// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace reel::core {

enum class FetchErrc {
    success = 0,
    network_error,
    timeout,
    http_status,
    range_not_supported,
    size_mismatch,
    incomplete_body,
    exhausted_retries,
    mux_failed,
    cancelled,
    invalid_url,
    invalid_argument,
    invalid_config,
    invalid_manifest,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:             return "Success";
            case FetchErrc::network_error:       return "Network error";
            case FetchErrc::timeout:             return "Operation timed out";
            case FetchErrc::http_status:         return "Unexpected HTTP status";
            case FetchErrc::range_not_supported: return "Server ignored byte range";
            case FetchErrc::size_mismatch:       return "Body larger than reported length";
            case FetchErrc::incomplete_body:     return "Body shorter than reported length";
            case FetchErrc::exhausted_retries:   return "Retries exhausted";
            case FetchErrc::mux_failed:          return "Muxer exited with an error";
            case FetchErrc::cancelled:           return "Cancelled";
            case FetchErrc::invalid_url:         return "Invalid URL";
            case FetchErrc::invalid_argument:    return "Invalid argument";
            case FetchErrc::invalid_config:      return "Invalid configuration";
            case FetchErrc::invalid_manifest:    return "Invalid manifest";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

// Transient transfer errors the Fetcher retries with backoff.
// Disk errors and everything terminal are not retryable.
[[nodiscard]] inline bool is_retryable(const std::error_code& ec) noexcept {
    if (ec.category() != fetch_errc_category()) return false;
    switch (static_cast<FetchErrc>(ec.value())) {
        case FetchErrc::network_error:
        case FetchErrc::timeout:
        case FetchErrc::http_status:
        case FetchErrc::size_mismatch:
        case FetchErrc::incomplete_body:
            return true;
        default:
            return false;
    }
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::FetchErrc> : true_type {};

} // namespace std
