// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/config.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace reel::core {

namespace {

// Copy json[key] into out when present; a type mismatch is an error
template<typename T>
bool read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;

    // get<> would wrap -1 and truncate 2.5
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            spdlog::error("config: field '{}' must be a non-negative integer, got {}", key, it->dump());
            return false;
        }
        if (it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            spdlog::error("config: field '{}' is out of range", key);
            return false;
        }
    }

    try {
        out = it->template get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: field '{}' has the wrong type: {}", key, e.what());
        return false;
    }
}

} // namespace

std::error_code EngineConfig::validate() const noexcept {
    if (max_attempts == 0) return make_error_code(FetchErrc::invalid_config);
    if (worker_count == 0 || worker_count > MAX_WORKER_COUNT) return make_error_code(FetchErrc::invalid_config);
    if (!(backoff_base >= 0.0)) return make_error_code(FetchErrc::invalid_config);
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) return make_error_code(FetchErrc::invalid_config);
    return {};
}

std::expected<EngineConfig, std::error_code>
parse_config(std::string_view json_text, EngineConfig base) noexcept {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    if (!j.is_object()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    EngineConfig cfg = std::move(base);
    bool ok = read_field(j, "max_attempts", cfg.max_attempts)
           && read_field(j, "backoff_base", cfg.backoff_base)
           && read_field(j, "worker_count", cfg.worker_count)
           && read_field(j, "connect_timeout_sec", cfg.connect_timeout_sec)
           && read_field(j, "low_speed_timeout_sec", cfg.low_speed_timeout_sec)
           && read_field(j, "chunk_size", cfg.chunk_size)
           && read_field(j, "user_agent", cfg.user_agent)
           && read_field(j, "segment_extension", cfg.segment_extension)
           && read_field(j, "muxer_program", cfg.muxer_program);
    if (!ok) {
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

std::expected<EngineConfig, std::error_code>
load_config(const std::string& path, EngineConfig base) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return parse_config(ss.str(), std::move(base));
}

} // namespace reel::core
