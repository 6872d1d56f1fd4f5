// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace reel::disk {

// Append-only writer for one segment's part file.
// Each worker owns its own writer, so there is no locking.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open for appending, creating the file when missing.
    // size() reports the bytes already present.
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Append the whole buffer (short writes are retried)
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Drop everything written so far
    [[nodiscard]] std::error_code truncate() noexcept;

    // Push data to stable storage
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t size_{0};
};

// Size of a regular file; file_not_found when it does not exist
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
file_size(std::string_view path) noexcept;

[[nodiscard]] bool file_exists(std::string_view path) noexcept;

// Single rename(2): the destination appears complete or not at all
[[nodiscard]] std::error_code rename_atomic(std::string_view from, std::string_view to) noexcept;

[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

// mkdir -p
[[nodiscard]] std::error_code ensure_directory(std::string_view path) noexcept;

// Replace the file with the given contents
[[nodiscard]] std::error_code write_text_file(std::string_view path, std::string_view content) noexcept;

} // namespace reel::disk
