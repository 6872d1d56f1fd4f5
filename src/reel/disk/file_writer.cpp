// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace reel::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:       return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:       return make_error_code(DiskErrc::invalid_path);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , size_(other.size_) {
    other.fd_ = -1;
    other.size_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        size_ = other.size_;
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path) noexcept {
    close();
    path_ = path;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return from_errno(err, DiskErrc::read_error);
    }

    fd_ = fd;
    size_ = static_cast<std::uint64_t>(st.st_size);
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    std::size_t left = size;
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
        size_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::truncate() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd_, 0) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    size_ = 0;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Free functions
//=============================================================================

std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept {
    std::string p(path);
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) {
        return std::unexpected(from_errno(errno, DiskErrc::read_error));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

bool file_exists(std::string_view path) noexcept {
    std::string p(path);
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0;
}

std::error_code rename_atomic(std::string_view from, std::string_view to) noexcept {
    std::string src(from);
    std::string dst(to);
    if (std::rename(src.c_str(), dst.c_str()) != 0) {
        return from_errno(errno, DiskErrc::rename_failed);
    }
    return {};
}

std::error_code remove_file(std::string_view path) noexcept {
    std::string p(path);
    if (::unlink(p.c_str()) != 0) {
        return from_errno(errno, DiskErrc::remove_failed);
    }
    return {};
}

std::error_code ensure_directory(std::string_view path) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path), ec);
    if (ec) {
        return from_errno(ec.value(), DiskErrc::create_dir_failed);
    }
    return {};
}

std::error_code write_text_file(std::string_view path, std::string_view content) noexcept {
    std::string p(path);
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }

    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return from_errno(err, DiskErrc::write_error);
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }

    if (::close(fd) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace reel::disk
