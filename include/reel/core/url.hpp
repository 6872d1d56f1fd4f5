// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // Resolve a manifest reference against the manifest's own URL
    [[nodiscard]] static std::string resolve(std::string_view base, std::string_view reference);

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path component, percent-decoded; "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    // filename() without its extension; "output" when nothing is left
    [[nodiscard]] std::string stem() const;

    // ".mp4" style extension of filename(), or empty
    [[nodiscard]] std::string extension() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Decode %XX escapes; malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace reel::core
