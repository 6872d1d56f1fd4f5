// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace reel::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool has_scheme(std::string_view ref) noexcept {
    auto pos = ref.find("://");
    if (pos == std::string_view::npos || pos == 0) return false;
    return std::all_of(ref.begin(), ref.begin() + static_cast<std::ptrdiff_t>(pos), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3;

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) path_start = url_str.length();

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) query_start = url_str.length();

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    if (path_start == host_end && path_start < url_str.length()) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    return url;
}

std::string Url::resolve(std::string_view base, std::string_view reference) {
    if (has_scheme(reference)) {
        return std::string(reference);
    }

    // Drop query/fragment from the base before looking for the directory
    auto cut = base.find_first_of("?#");
    if (cut != std::string_view::npos) {
        base = base.substr(0, cut);
    }

    auto scheme_end = base.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::string(reference);
    }

    if (reference.starts_with("//")) {
        return std::string(base.substr(0, scheme_end + 1)) + std::string(reference);
    }

    auto host_end = base.find('/', scheme_end + 3);
    std::string_view origin = host_end == std::string_view::npos ? base : base.substr(0, host_end);

    if (reference.starts_with("/")) {
        return std::string(origin) + std::string(reference);
    }

    // Directory of the base path, always ending in '/'
    std::string dir;
    if (host_end == std::string_view::npos) {
        dir = std::string(base) + "/";
    } else {
        dir = std::string(base.substr(0, base.rfind('/') + 1));
    }

    // Fold leading ./ and ../ components
    while (true) {
        if (reference.starts_with("./")) {
            reference.remove_prefix(2);
        } else if (reference.starts_with("../")) {
            reference.remove_prefix(3);
            if (dir.size() > origin.size() + 1) {
                auto parent = dir.rfind('/', dir.size() - 2);
                if (parent != std::string::npos && parent >= origin.size()) {
                    dir.resize(parent + 1);
                }
            }
        } else {
            break;
        }
    }

    return dir + std::string(reference);
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty()) {
        return "index.html";
    }
    return percent_decode(name);
}

std::string Url::stem() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    name = percent_decode(name);
    auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name.resize(dot);
    }
    return name.empty() ? "output" : name;
}

std::string Url::extension() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return {};
    }
    return name.substr(dot);
}

} // namespace reel::core
