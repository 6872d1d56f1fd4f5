// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// External program that concatenates the listed files into one container
class Muxer {
public:
    virtual ~Muxer() = default;

    // Returns the process exit code; an error only when it could not run at all
    [[nodiscard]] virtual std::expected<int, std::error_code>
    mux(const std::string& manifest_path, const std::string& output_path) = 0;
};

// ffmpeg concat demuxer with stream copy
class FfmpegMuxer final : public Muxer {
public:
    explicit FfmpegMuxer(std::string program = "ffmpeg") : program_(std::move(program)) {}

    [[nodiscard]] std::expected<int, std::error_code>
    mux(const std::string& manifest_path, const std::string& output_path) override;

    // argv without the program name
    [[nodiscard]] static std::vector<std::string>
    build_args(const std::string& manifest_path, const std::string& output_path);

    [[nodiscard]] const std::string& program() const noexcept { return program_; }

private:
    std::string program_;
};

// True when a path is taken
using NameProbe = std::function<bool(const std::string&)>;

// "<dir>/<base><ext>", or the first free "<dir>/<base>_<n><ext>" for n = 1, 2, ...
[[nodiscard]] std::string next_available_name(std::string_view directory, std::string_view base,
                                              std::string_view extension, const NameProbe& exists);

// Same, probing the real filesystem
[[nodiscard]] std::string next_available_name(std::string_view directory, std::string_view base,
                                              std::string_view extension);

// Concat demuxer script: one "file '<path>'" line per entry
[[nodiscard]] std::string concat_manifest(const std::vector<std::string>& absolute_paths);

// Hands the ordered segments to the muxer and cleans up after it.
// Intermediates are deleted only once the muxer has exited with 0.
class Assembler {
public:
    Assembler(Muxer& muxer, std::string directory, std::string name)
        : muxer_(muxer), directory_(std::move(directory)), name_(std::move(name)) {}

    // Returns output_path on success
    [[nodiscard]] std::expected<std::string, std::error_code>
    assemble(const std::vector<std::string>& ordered_paths, const std::string& output_path);

    // "<directory>/<name>_concat.txt"
    [[nodiscard]] std::string manifest_path() const;

private:
    Muxer& muxer_;
    std::string directory_;
    std::string name_;
};

} // namespace reel::media
