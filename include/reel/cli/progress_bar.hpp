// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace reel::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    enum class Unit { items, bytes };

    ProgressBar(std::uint64_t total, std::string_view label = {}, Unit unit = Unit::items);

    // Update progress (thread-safe)
    void update(std::uint64_t current) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    void unit(Unit u) noexcept { unit_ = u; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

    // The line update() would draw, without the leading '\r'
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed) const;

private:
    [[nodiscard]] std::string format_amount(std::uint64_t value) const;

    std::mutex mutex_;
    std::uint64_t total_{0};
    std::uint64_t last_drawn_{0};
    std::string label_;
    Unit unit_{Unit::items};
    bool drawn_{false};
    bool finished_{false};
    std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

} // namespace reel::cli
