// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/assembler.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace reel::media {

namespace fs = std::filesystem;

//=============================================================================
// FfmpegMuxer
//=============================================================================

std::vector<std::string>
FfmpegMuxer::build_args(const std::string& manifest_path, const std::string& output_path) {
    return {"-y", "-f", "concat", "-safe", "0", "-i", manifest_path, "-c", "copy", output_path};
}

std::expected<int, std::error_code>
FfmpegMuxer::mux(const std::string& manifest_path, const std::string& output_path) {
    auto args = build_args(manifest_path, output_path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program_.data());
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // ffmpeg is chatty; keep the progress bar readable
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    if (spdlog::should_log(spdlog::level::debug)) {
        std::string line = program_;
        for (const auto& arg : args) {
            line += ' ';
            line += arg;
        }
        spdlog::debug("Running {}", line);
    }

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        spdlog::error("Cannot start {}: {}", program_, std::strerror(rc));
        return std::unexpected(std::error_code(rc, std::system_category()));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(std::error_code(errno, std::system_category()));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;  // Killed by a signal
}

//=============================================================================
// Naming
//=============================================================================

std::string next_available_name(std::string_view directory, std::string_view base,
                                std::string_view extension, const NameProbe& exists) {
    auto candidate = (fs::path(directory) / std::format("{}{}", base, extension)).string();
    for (std::uint32_t n = 1; exists(candidate); ++n) {
        candidate = (fs::path(directory) / std::format("{}_{}{}", base, n, extension)).string();
    }
    return candidate;
}

std::string next_available_name(std::string_view directory, std::string_view base,
                                std::string_view extension) {
    return next_available_name(directory, base, extension,
                               [](const std::string& path) { return disk::file_exists(path); });
}

std::string concat_manifest(const std::vector<std::string>& absolute_paths) {
    std::string out;
    for (const auto& path : absolute_paths) {
        out += "file '";
        for (char c : path) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += "'\n";
    }
    return out;
}

//=============================================================================
// Assembler
//=============================================================================

std::string Assembler::manifest_path() const {
    return (fs::path(directory_) / (name_ + "_concat.txt")).string();
}

std::expected<std::string, std::error_code>
Assembler::assemble(const std::vector<std::string>& ordered_paths, const std::string& output_path) {
    if (ordered_paths.empty()) {
        return std::unexpected(make_error_code(core::FetchErrc::invalid_argument));
    }

    std::vector<std::string> absolute;
    absolute.reserve(ordered_paths.size());
    for (const auto& path : ordered_paths) {
        std::error_code ec;
        auto abs = fs::absolute(path, ec);
        if (ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
        }
        absolute.push_back(abs.string());
    }

    const auto manifest = manifest_path();
    if (auto ec = disk::write_text_file(manifest, concat_manifest(absolute))) {
        return std::unexpected(ec);
    }

    spdlog::info("Merging {} segments into {}", ordered_paths.size(), output_path);

    auto exit_code = muxer_.mux(manifest, output_path);
    if (!exit_code) {
        return std::unexpected(exit_code.error());
    }
    if (*exit_code != 0) {
        spdlog::error("Muxer exited with {}; keeping {} segments and {}", *exit_code,
                      ordered_paths.size(), manifest);
        return std::unexpected(make_error_code(core::FetchErrc::mux_failed));
    }

    // Removal failures after a successful mux are not fatal
    for (const auto& path : ordered_paths) {
        if (auto ec = disk::remove_file(path)) {
            spdlog::warn("Could not remove {}: {}", path, ec.message());
        }
    }
    if (auto ec = disk::remove_file(manifest)) {
        spdlog::warn("Could not remove {}: {}", manifest, ec.message());
    }

    return output_path;
}

} // namespace reel::media
