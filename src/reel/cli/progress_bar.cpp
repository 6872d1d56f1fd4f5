// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace reel::cli {

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label, Unit unit)
    : total_(total)
    , label_(label)
    , unit_(unit) {}

void ProgressBar::update(std::uint64_t current) noexcept {
    std::lock_guard lock(mutex_);
    if (finished_) return;

    if (total_ > 0 && drawn_) {
        // Only redraw if significant progress (every 1%), or every item
        auto scaled = current * 100 / total_;
        auto last_scaled = last_drawn_ * 100 / total_;
        if (unit_ == Unit::bytes && scaled <= last_scaled && current != total_) return;
    }

    last_drawn_ = current;
    drawn_ = true;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    std::uint64_t speed = elapsed > 0 ? current * 1000 / static_cast<std::uint64_t>(elapsed) : 0;

    try {
        std::cout << '\r' << render(current, speed) << std::string(10, ' ') << std::flush;
    } catch (const std::exception&) {
        // Terminal output is best effort
    }
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ == 0) {
        // Unknown total: running count only
        line += format_amount(current);
        return line;
    }

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    line += '>';
    line.append(static_cast<std::size_t>(bar_width - filled), ' ');
    line += ']';

    line += std::format(" {:3}%", static_cast<int>(percent));
    line += std::format(" ({}/{})", format_amount(current), format_amount(total_));

    if (unit_ == Unit::bytes && speed > 0) {
        line += " @ ";
        line += format_bytes(speed);
        line += "/s";
        if (current < total_) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed);
        }
    }
    return line;
}

void ProgressBar::finish() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (finished_) return;
    }
    if (total_ > 0) {
        update(total_);
    }
    std::lock_guard lock(mutex_);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::lock_guard lock(mutex_);
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::format_amount(std::uint64_t value) const {
    return unit_ == Unit::bytes ? format_bytes(value) : std::to_string(value);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return std::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    } else if (bytes >= GB) {
        return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

} // namespace reel::cli
