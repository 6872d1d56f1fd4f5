// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace reel::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    rename_failed,
    remove_failed,
    create_dir_failed,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:           return "Success";
            case DiskErrc::file_not_found:    return "File not found";
            case DiskErrc::access_denied:     return "Access denied";
            case DiskErrc::disk_full:         return "Disk full";
            case DiskErrc::invalid_path:      return "Invalid path";
            case DiskErrc::write_error:       return "Write error";
            case DiskErrc::read_error:        return "Read error";
            case DiskErrc::rename_failed:     return "Rename failed";
            case DiskErrc::remove_failed:     return "Remove failed";
            case DiskErrc::create_dir_failed: return "Cannot create directory";
            case DiskErrc::handle_invalid:    return "Invalid handle";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value from a failed file operation
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace reel::disk

namespace std {

template<>
struct is_error_code_enum<reel::disk::DiskErrc> : true_type {};

} // namespace std
